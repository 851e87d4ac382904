#pragma once

#include "certificate_generator.hpp"
#include <string>
#include <vector>

namespace ds {

// Generates certificates by running `openssl req -x509` as a child process.
// The request config goes to a temporary file that never outlives generate().
class OpensslCliGenerator : public CertificateGenerator {
public:
    // Empty executable: search $PATH for "openssl".
    // Empty temp_dir: std::filesystem::temp_directory_path().
    explicit OpensslCliGenerator(std::string executable = "", std::string temp_dir = "");

    bool available() const override { return !executable_.empty(); }
    std::string name() const override { return "openssl"; }
    void generate(const CertificateRequest& request) override;

    const std::string& executable() const { return executable_; }

    // Contents of the `-config` file for a request
    static std::string render_config(const CertificateRequest& request);

    // First executable named `program` in the ':'-separated search path
    static std::string find_in_path(const std::string& program, const std::string& search_path);

private:
    struct ProcessResult {
        int exit_code = -1;
        std::string output;
    };

    static ProcessResult run(const std::vector<std::string>& argv);

    std::string executable_;
    std::string temp_dir_;
};

} // namespace ds
