#pragma once

#include "certificate_generator.hpp"

namespace ds {

// In-process generation through libcrypto; needs no external tools
class BuiltinGenerator : public CertificateGenerator {
public:
    bool available() const override { return true; }
    std::string name() const override { return "builtin"; }
    void generate(const CertificateRequest& request) override;
};

} // namespace ds
