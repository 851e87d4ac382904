#include "certificate_provisioner.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "errors.hpp"
#include "test_helpers.hpp"

namespace ds {

namespace {

// Writes placeholder PEM files, or misbehaves on demand
class FakeGenerator : public CertificateGenerator {
 public:
  enum class Mode { Succeed, Unavailable, FailAfterKey, ThrowForeign, WriteNothing };

  explicit FakeGenerator(Mode mode = Mode::Succeed) : mode(mode) {}

  bool available() const override { return mode != Mode::Unavailable; }
  std::string name() const override { return "fake"; }

  void generate(const CertificateRequest& request) override {
    ++calls;
    requests.push_back(request);
    switch (mode) {
      case Mode::Succeed:
        test::writeFile(request.key_path, "KEY");
        test::writeFile(request.cert_path, "CERT");
        break;
      case Mode::FailAfterKey:
        test::writeFile(request.key_path, "KEY");
        throw ProvisioningError("openssl exited with status 1");
      case Mode::ThrowForeign:
        test::writeFile(request.cert_path, "CERT");
        throw std::runtime_error("disk full");
      case Mode::WriteNothing:
      case Mode::Unavailable:
        break;
    }
  }

  Mode mode;
  int calls{0};
  std::vector<CertificateRequest> requests;
};

std::vector<std::string> sanStrings(const std::vector<SubjectAltName>& sans) {
  std::vector<std::string> out;
  for (const auto& san : sans) {
    out.push_back(san.to_string());
  }
  return out;
}

}  // namespace

TEST(SubjectAltNames, LocalhostLoopbackAndLanAddress) {
  EXPECT_EQ(sanStrings(build_subject_alt_names("192.168.1.50")),
            (std::vector<std::string>{"DNS:localhost", "IP:127.0.0.1", "IP:192.168.1.50"}));
}

TEST(SubjectAltNames, LoopbackFallbackIsNotDuplicated) {
  EXPECT_EQ(sanStrings(build_subject_alt_names("127.0.0.1")),
            (std::vector<std::string>{"DNS:localhost", "IP:127.0.0.1"}));
}

TEST(SubjectAltNames, Ipv6AndHostnames) {
  EXPECT_EQ(sanStrings(build_subject_alt_names("fd00::5")).back(), "IP:fd00::5");
  EXPECT_EQ(sanStrings(build_subject_alt_names("devbox.local")).back(), "DNS:devbox.local");
}

TEST(SubjectAltNames, JoinedForOpensslConfig) {
  EXPECT_EQ(join_subject_alt_names(build_subject_alt_names("10.0.0.7")),
            "DNS:localhost,IP:127.0.0.1,IP:10.0.0.7");
}

TEST(CertificateProvisioner, GeneratesWhenMissing) {
  test::TempDir dir;
  FakeGenerator generator;
  CertificateProvisioner provisioner(generator);

  provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50");

  ASSERT_EQ(generator.calls, 1);
  const auto& request = generator.requests.front();
  EXPECT_EQ(request.cert_path, dir.file("cert.pem"));
  EXPECT_EQ(request.key_path, dir.file("key.pem"));
  EXPECT_EQ(request.common_name, "localhost");
  EXPECT_EQ(request.validity_days, 365);
  EXPECT_EQ(request.key_bits, 2048);
  EXPECT_EQ(sanStrings(request.subject_alt_names),
            (std::vector<std::string>{"DNS:localhost", "IP:127.0.0.1", "IP:192.168.1.50"}));
  EXPECT_TRUE(std::filesystem::exists(dir.file("cert.pem")));
  EXPECT_TRUE(std::filesystem::exists(dir.file("key.pem")));
}

TEST(CertificateProvisioner, KeyIsOwnerOnly) {
  test::TempDir dir;
  FakeGenerator generator;
  CertificateProvisioner provisioner(generator);
  provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50");

  auto perms = std::filesystem::status(dir.file("key.pem")).permissions();
  EXPECT_EQ(perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all),
            std::filesystem::perms::none);
}

TEST(CertificateProvisioner, SecondCallDoesNothing) {
  test::TempDir dir;
  FakeGenerator generator;
  CertificateProvisioner provisioner(generator);

  provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50");
  auto certTime = std::filesystem::last_write_time(dir.file("cert.pem"));
  auto keyTime = std::filesystem::last_write_time(dir.file("key.pem"));

  provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "10.1.2.3");

  EXPECT_EQ(generator.calls, 1);
  EXPECT_EQ(std::filesystem::last_write_time(dir.file("cert.pem")), certTime);
  EXPECT_EQ(std::filesystem::last_write_time(dir.file("key.pem")), keyTime);
}

TEST(CertificateProvisioner, ExistingPairIsNotValidated) {
  test::TempDir dir;
  test::writeFile(dir.file("cert.pem"), "not a certificate");
  test::writeFile(dir.file("key.pem"), "not a key");
  FakeGenerator generator(FakeGenerator::Mode::Unavailable);
  CertificateProvisioner provisioner(generator);

  EXPECT_NO_THROW(provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50"));
  EXPECT_EQ(generator.calls, 0);
  EXPECT_EQ(test::readFile(dir.file("cert.pem")), "not a certificate");
}

TEST(CertificateProvisioner, UnavailableGeneratorFailsWithRemediation) {
  test::TempDir dir;
  FakeGenerator generator(FakeGenerator::Mode::Unavailable);
  CertificateProvisioner provisioner(generator);

  try {
    provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50");
    FAIL() << "expected ProvisioningError";
  } catch (const ProvisioningError& e) {
    std::string message = e.what();
    EXPECT_NE(message.find("Install OpenSSL"), std::string::npos) << message;
    EXPECT_NE(message.find("cert.pem/key.pem"), std::string::npos) << message;
  }
  EXPECT_EQ(generator.calls, 0);
  EXPECT_TRUE(dir.empty());
}

TEST(CertificateProvisioner, FailedGenerationLeavesNoFiles) {
  test::TempDir dir;
  FakeGenerator generator(FakeGenerator::Mode::FailAfterKey);
  CertificateProvisioner provisioner(generator);

  EXPECT_THROW(provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50"), ProvisioningError);
  EXPECT_FALSE(std::filesystem::exists(dir.file("cert.pem")));
  EXPECT_FALSE(std::filesystem::exists(dir.file("key.pem")));
}

TEST(CertificateProvisioner, OtherGeneratorErrorsBecomeProvisioningError) {
  test::TempDir dir;
  FakeGenerator generator(FakeGenerator::Mode::ThrowForeign);
  CertificateProvisioner provisioner(generator);

  try {
    provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50");
    FAIL() << "expected ProvisioningError";
  } catch (const ProvisioningError& e) {
    EXPECT_NE(std::string(e.what()).find("disk full"), std::string::npos);
  }
  EXPECT_TRUE(dir.empty());
}

TEST(CertificateProvisioner, SilentGeneratorIsAnError) {
  test::TempDir dir;
  FakeGenerator generator(FakeGenerator::Mode::WriteNothing);
  CertificateProvisioner provisioner(generator);

  EXPECT_THROW(provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50"), ProvisioningError);
  EXPECT_TRUE(dir.empty());
}

TEST(CertificateProvisioner, LoneCertificateIsRegenerated) {
  test::TempDir dir;
  test::writeFile(dir.file("cert.pem"), "stale");
  FakeGenerator generator;
  CertificateProvisioner provisioner(generator);

  provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50");

  EXPECT_EQ(generator.calls, 1);
  EXPECT_EQ(test::readFile(dir.file("cert.pem")), "CERT");
  EXPECT_EQ(test::readFile(dir.file("key.pem")), "KEY");
  EXPECT_FALSE(std::filesystem::exists(dir.file("cert.pem.devserve-orig")));
}

TEST(CertificateProvisioner, LoneKeyIsRegenerated) {
  test::TempDir dir;
  test::writeFile(dir.file("key.pem"), "stale");
  FakeGenerator generator;
  CertificateProvisioner provisioner(generator);

  provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50");

  EXPECT_EQ(generator.calls, 1);
  EXPECT_EQ(test::readFile(dir.file("key.pem")), "KEY");
  EXPECT_EQ(test::readFile(dir.file("cert.pem")), "CERT");
}

TEST(CertificateProvisioner, LoneCertificateSurvivesFailedGeneration) {
  test::TempDir dir;
  test::writeFile(dir.file("cert.pem"), "USER CERT");
  FakeGenerator generator(FakeGenerator::Mode::FailAfterKey);
  CertificateProvisioner provisioner(generator);

  EXPECT_THROW(provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50"), ProvisioningError);

  ASSERT_TRUE(std::filesystem::exists(dir.file("cert.pem")));
  EXPECT_EQ(test::readFile(dir.file("cert.pem")), "USER CERT");
  EXPECT_FALSE(std::filesystem::exists(dir.file("key.pem")));
  EXPECT_FALSE(std::filesystem::exists(dir.file("cert.pem.devserve-orig")));
}

TEST(CertificateProvisioner, LoneKeySurvivesOverwritingFailure) {
  test::TempDir dir;
  test::writeFile(dir.file("key.pem"), "USER KEY");
  // Writes cert.pem, then fails
  FakeGenerator generator(FakeGenerator::Mode::ThrowForeign);
  CertificateProvisioner provisioner(generator);

  EXPECT_THROW(provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50"), ProvisioningError);

  EXPECT_EQ(test::readFile(dir.file("key.pem")), "USER KEY");
  EXPECT_FALSE(std::filesystem::exists(dir.file("cert.pem")));
  EXPECT_FALSE(std::filesystem::exists(dir.file("key.pem.devserve-orig")));
}

TEST(CertificateProvisioner, LoneFileSurvivesSilentGenerator) {
  test::TempDir dir;
  test::writeFile(dir.file("cert.pem"), "USER CERT");
  FakeGenerator generator(FakeGenerator::Mode::WriteNothing);
  CertificateProvisioner provisioner(generator);

  EXPECT_THROW(provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50"), ProvisioningError);
  EXPECT_EQ(test::readFile(dir.file("cert.pem")), "USER CERT");
}

TEST(CertificateProvisioner, LoneFileUntouchedWhenGeneratorUnavailable) {
  test::TempDir dir;
  test::writeFile(dir.file("cert.pem"), "USER CERT");
  FakeGenerator generator(FakeGenerator::Mode::Unavailable);
  CertificateProvisioner provisioner(generator);

  EXPECT_THROW(provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50"), ProvisioningError);
  EXPECT_EQ(test::readFile(dir.file("cert.pem")), "USER CERT");
}

TEST(CertificateProvisioner, CustomValidityAndKeySize) {
  test::TempDir dir;
  FakeGenerator generator;
  CertificateProvisioner provisioner(generator, 30, 3072);

  provisioner.ensure(dir.file("cert.pem"), dir.file("key.pem"), "192.168.1.50");

  ASSERT_EQ(generator.calls, 1);
  EXPECT_EQ(generator.requests.front().validity_days, 30);
  EXPECT_EQ(generator.requests.front().key_bits, 3072);
}

}  // namespace ds
