/**
 * @file AuthenticatorTests.cpp
 *
 * This module contains the unit tests of the functions which turn
 * a realm into the value of an authorization header.
 *
 * © 2018 by Richard Walters
 */

#include <AsyncHttp/Authenticator.hpp>
#include <AsyncHttp/Digest.hpp>
#include <gtest/gtest.h>

namespace {

    /**
     * This function parses the given string as a URI, for brevity.
     */
    Uri::Uri ParseUri(const std::string& uriString) {
        Uri::Uri uri;
        (void)uri.ParseFromString(uriString);
        return uri;
    }

}

TEST(AuthenticatorTests, ComputeRealmUriRelativeForm) {
    const auto uri = ParseUri("http://www.example.com/dir/index.html?x=1#top");
    EXPECT_EQ("/dir/index.html?x=1", AsyncHttp::ComputeRealmUri(uri, false, false));
    EXPECT_EQ("/dir/index.html", AsyncHttp::ComputeRealmUri(uri, false, true));
}

TEST(AuthenticatorTests, ComputeRealmUriAbsoluteForm) {
    const auto uri = ParseUri("http://www.example.com/dir/index.html?x=1#top");
    EXPECT_EQ("http://www.example.com/dir/index.html?x=1", AsyncHttp::ComputeRealmUri(uri, true, false));
    EXPECT_EQ("http://www.example.com/dir/index.html", AsyncHttp::ComputeRealmUri(uri, true, true));
}

TEST(AuthenticatorTests, ComputeRealmUriEmptyPath) {
    EXPECT_EQ("/", AsyncHttp::ComputeRealmUri(ParseUri("http://www.example.com"), false, false));
}

TEST(AuthenticatorTests, BasicAuthentication) {
    AsyncHttp::Realm::Builder builder("Aladdin", "open sesame");
    const auto realm = builder
        .SetScheme(AsyncHttp::Realm::AuthScheme::Basic)
        .Build();
    ASSERT_FALSE(realm == nullptr);
    EXPECT_EQ(
        "Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==",
        AsyncHttp::ComputeBasicAuthentication(*realm)
    );
}

TEST(AuthenticatorTests, DigestAuthenticationWithQop) {
    AsyncHttp::Realm::Builder builder("Mufasa", "Circle Of Life");
    const auto realm = builder
        .SetScheme(AsyncHttp::Realm::AuthScheme::Digest)
        .SetRealmName("testrealm@host.com")
        .SetNonce("dcd98b7102dd2f0e8b11d0f600bfb0c093")
        .SetOpaque("5ccc069c403ebaf9f0171e9517f40e41")
        .SetQop("auth")
        .SetUri(ParseUri("http://www.example.com/dir/index.html"))
        .Build();
    ASSERT_FALSE(realm == nullptr);
    EXPECT_EQ(32u, realm->GetResponse().length());
    EXPECT_EQ(
        "Digest username=\"Mufasa\", realm=\"testrealm@host.com\", "
        "nonce=\"dcd98b7102dd2f0e8b11d0f600bfb0c093\", uri=\"/dir/index.html\", "
        "response=\"" + realm->GetResponse() + "\", opaque=\"5ccc069c403ebaf9f0171e9517f40e41\", "
        "qop=auth, nc=00000001, cnonce=\"" + realm->GetCnonce() + "\"",
        AsyncHttp::ComputeDigestAuthentication(
            *realm,
            ParseUri("http://www.example.com/dir/index.html")
        )
    );
}

TEST(AuthenticatorTests, DigestAuthenticationPrefersRealmUri) {
    AsyncHttp::Realm::Builder builder("alice", "secret");
    const auto realm = builder
        .SetScheme(AsyncHttp::Realm::AuthScheme::Digest)
        .SetRealmName("r")
        .SetNonce("n")
        .SetAlgorithm("MD5")
        .SetUri(ParseUri("http://www.example.com/realm/path"))
        .Build();
    ASSERT_FALSE(realm == nullptr);
    EXPECT_EQ(
        "Digest username=\"alice\", realm=\"r\", nonce=\"n\", "
        "uri=\"/realm/path\", algorithm=MD5, response=\"" + realm->GetResponse() + "\"",
        AsyncHttp::ComputeDigestAuthentication(
            *realm,
            ParseUri("http://www.example.com/request/path")
        )
    );
}

TEST(AuthenticatorTests, NoHeaderWithoutRealm) {
    AsyncHttp::Request request;
    std::string header;
    EXPECT_FALSE(AsyncHttp::PerRequestAuthorizationHeader(request, nullptr, header));
    EXPECT_FALSE(AsyncHttp::PerRequestProxyAuthorizationHeader(request, nullptr, header));
}

TEST(AuthenticatorTests, NoHeaderWithoutPreemptiveAuthentication) {
    AsyncHttp::Request request;
    AsyncHttp::Realm::Builder builder("alice", "secret");
    const auto realm = builder
        .SetScheme(AsyncHttp::Realm::AuthScheme::Basic)
        .Build();
    std::string header;
    EXPECT_FALSE(AsyncHttp::PerRequestAuthorizationHeader(request, realm, header));
}

TEST(AuthenticatorTests, PreemptiveBasicHeader) {
    AsyncHttp::Request request;
    AsyncHttp::Realm::Builder builder("Aladdin", "open sesame");
    const auto realm = builder
        .SetScheme(AsyncHttp::Realm::AuthScheme::Basic)
        .SetUsePreemptiveAuth(true)
        .Build();
    std::string header;
    ASSERT_TRUE(AsyncHttp::PerRequestAuthorizationHeader(request, realm, header));
    EXPECT_EQ("Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==", header);
    header.clear();
    ASSERT_TRUE(AsyncHttp::PerRequestProxyAuthorizationHeader(request, realm, header));
    EXPECT_EQ("Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==", header);
}

TEST(AuthenticatorTests, PreemptiveDigestHeaderNeedsNonce) {
    AsyncHttp::Request request;
    (void)request.target.ParseFromString("http://www.example.com/a?b=c");
    AsyncHttp::Realm::Builder withoutNonceBuilder("alice", "secret");
    const auto withoutNonce = withoutNonceBuilder
        .SetScheme(AsyncHttp::Realm::AuthScheme::Digest)
        .SetUsePreemptiveAuth(true)
        .Build();
    std::string header;
    EXPECT_FALSE(AsyncHttp::PerRequestAuthorizationHeader(request, withoutNonce, header));

    AsyncHttp::Realm::Builder withNonceBuilder("alice", "secret");
    const auto withNonce = withNonceBuilder
        .SetScheme(AsyncHttp::Realm::AuthScheme::Digest)
        .SetRealmName("r")
        .SetNonce("n")
        .SetUsePreemptiveAuth(true)
        .Build();
    ASSERT_TRUE(AsyncHttp::PerRequestAuthorizationHeader(request, withNonce, header));
    EXPECT_EQ(
        "Digest username=\"alice\", realm=\"r\", nonce=\"n\", uri=\"/a?b=c\", "
        "response=\""
        + AsyncHttp::Digest::Md5Hex(
            AsyncHttp::Digest::Md5Hex("alice:r:secret")
            + ":n:"
            + AsyncHttp::Digest::Md5Hex("GET:/a?b=c")
        )
        + "\"",
        header
    );
}

TEST(AuthenticatorTests, PreemptiveDigestResponseCoversRequestMethodAndUri) {
    AsyncHttp::Request request;
    request.method = "POST";
    (void)request.target.ParseFromString("http://www.example.com/upload?id=7");
    AsyncHttp::Realm::Builder builder("Mufasa", "Circle Of Life");
    const auto realm = builder
        .SetScheme(AsyncHttp::Realm::AuthScheme::Digest)
        .SetRealmName("testrealm@host.com")
        .SetNonce("dcd98b7102dd2f0e8b11d0f600bfb0c093")
        .SetQop("auth")
        .SetUri(ParseUri("http://www.example.com/login"))
        .SetUsePreemptiveAuth(true)
        .Build();
    ASSERT_FALSE(realm == nullptr);
    std::string header;
    ASSERT_TRUE(AsyncHttp::PerRequestAuthorizationHeader(request, realm, header));
    EXPECT_NE(std::string::npos, header.find("uri=\"/upload?id=7\""));

    // Recompute with the client nonce sent in the header.
    const std::string cnonceParameter = "cnonce=\"";
    const auto cnonceStart = header.find(cnonceParameter);
    ASSERT_NE(std::string::npos, cnonceStart);
    const auto cnonce = header.substr(cnonceStart + cnonceParameter.length(), 32);
    AsyncHttp::Digest::Parameters parameters;
    parameters.principal = "Mufasa";
    parameters.password = "Circle Of Life";
    parameters.realmName = "testrealm@host.com";
    parameters.nonce = "dcd98b7102dd2f0e8b11d0f600bfb0c093";
    parameters.cnonce = cnonce;
    parameters.qop = "auth";
    parameters.method = "POST";
    parameters.digestUri = "/upload?id=7";
    std::string scratch;
    std::string expectedResponse;
    ASSERT_EQ(
        AsyncHttp::Digest::Result::Success,
        AsyncHttp::Digest::ComputeResponse(parameters, scratch, expectedResponse)
    );
    EXPECT_NE(std::string::npos, header.find("response=\"" + expectedResponse + "\""));
    EXPECT_NE(realm->GetResponse(), expectedResponse);
}

TEST(AuthenticatorTests, ConnectionLevelSchemesGiveNoHeader) {
    AsyncHttp::Request request;
    for (const auto scheme: {
        AsyncHttp::Realm::AuthScheme::Ntlm,
        AsyncHttp::Realm::AuthScheme::Spnego,
        AsyncHttp::Realm::AuthScheme::Kerberos,
    }) {
        AsyncHttp::Realm::Builder builder("alice", "secret");
        const auto realm = builder
            .SetScheme(scheme)
            .SetUsePreemptiveAuth(true)
            .Build();
        std::string header;
        EXPECT_FALSE(AsyncHttp::PerRequestAuthorizationHeader(request, realm, header));
        EXPECT_FALSE(AsyncHttp::PerRequestProxyAuthorizationHeader(request, realm, header));
    }
}
