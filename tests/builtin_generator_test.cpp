#include "builtin_generator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "certificate_info.hpp"
#include "certificate_provisioner.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include "tls_context.hpp"

namespace ds {

namespace {

std::vector<std::string> sorted(std::vector<std::string> values) {
  std::sort(values.begin(), values.end());
  return values;
}

}  // namespace

TEST(BuiltinGenerator, FreshDirectoryGetsCertificateForLanAddress) {
  test::TempDir dir;
  BuiltinGenerator generator;
  CertificateProvisioner provisioner(generator);

  provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50");

  ASSERT_TRUE(std::filesystem::exists(dir.file("cert.pem")));
  ASSERT_TRUE(std::filesystem::exists(dir.file("key.pem")));

  auto info = read_certificate_info(dir.file("cert.pem"));
  EXPECT_EQ(sorted(info.subject_alt_names),
            sorted({"DNS:localhost", "IP:127.0.0.1", "IP:192.168.1.50"}));
  EXPECT_NE(info.subject.find("CN=localhost"), std::string::npos) << info.subject;
  EXPECT_GE(info.days_remaining, 364);
  EXPECT_LE(info.days_remaining, 365);
}

TEST(BuiltinGenerator, KeyIsUnencryptedAndMatchesCertificate) {
  test::TempDir dir;
  BuiltinGenerator generator;
  CertificateRequest request;
  request.cert_path = dir.file("cert.pem");
  request.key_path = dir.file("key.pem");
  request.subject_alt_names = build_subject_alt_names("10.0.0.2");

  generator.generate(request);

  EXPECT_EQ(test::readFile(request.key_path).find("ENCRYPTED"), std::string::npos);
  EXPECT_NO_THROW(create_server_context(request.cert_path, request.key_path));
}

TEST(BuiltinGenerator, Ipv6SubjectAltName) {
  test::TempDir dir;
  BuiltinGenerator generator;
  CertificateRequest request;
  request.cert_path = dir.file("cert.pem");
  request.key_path = dir.file("key.pem");
  request.subject_alt_names = build_subject_alt_names("fd00::5");

  generator.generate(request);

  auto info = read_certificate_info(request.cert_path);
  EXPECT_TRUE(info.covers("IP:fd00::5"));
  EXPECT_TRUE(info.covers("DNS:localhost"));
}

TEST(BuiltinGenerator, UnwritableTargetThrows) {
  test::TempDir dir;
  BuiltinGenerator generator;
  CertificateRequest request;
  request.cert_path = dir.file("missing/cert.pem");
  request.key_path = dir.file("missing/key.pem");
  request.subject_alt_names = build_subject_alt_names("10.0.0.2");

  EXPECT_THROW(generator.generate(request), ProvisioningError);
}

TEST(CertificateInfo, UnparsableFileIsTlsConfigError) {
  test::TempDir dir;
  test::writeFile(dir.file("cert.pem"), "garbage");
  EXPECT_THROW(read_certificate_info(dir.file("cert.pem")), TlsConfigError);
  EXPECT_THROW(read_certificate_info(dir.file("absent.pem")), TlsConfigError);
}

}  // namespace ds
