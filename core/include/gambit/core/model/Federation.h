#pragma once

#include "gambit/core/Error.h"

#include <map>
#include <string>
#include <vector>

namespace gambit::core::model {

struct Federation {
    std::string code;
    std::string name;
};

// Owned table of federation descriptors. One instance lives for as long as
// the tournament context that created it; there is no process-wide table.
// Populate it once at start-up (RegisterDefaults, Register) and pass it by
// const reference to whoever needs lookups. Clear() empties it on teardown.
class FederationRegistry {
public:
    FederationRegistry() = default;
    FederationRegistry(const FederationRegistry&) = delete;
    FederationRegistry& operator=(const FederationRegistry&) = delete;
    FederationRegistry(FederationRegistry&&) = default;
    FederationRegistry& operator=(FederationRegistry&&) = default;

    // Codes are compared case-insensitively; "fide" and "FIDE" collide.
    bool Register(const std::string& code, const std::string& name, EngineError* error);
    bool RegisterDefaults(EngineError* error);
    bool Lookup(const std::string& code, Federation& out, EngineError* error) const;
    bool Contains(const std::string& code) const;
    void Clear();

    std::vector<Federation> All() const;
    size_t size() const { return federations_.size(); }

    static std::string Canonicalize(const std::string& code);

private:
    std::map<std::string, Federation> federations_;
};

}  // namespace gambit::core::model
