#include "gambit/core/model/Federation.h"

#include <cctype>

namespace gambit::core::model {

std::string FederationRegistry::Canonicalize(const std::string& code) {
    std::string canonical;
    canonical.reserve(code.size());
    for (unsigned char ch : code) {
        if (std::isspace(ch)) {
            continue;
        }
        canonical.push_back(static_cast<char>(std::toupper(ch)));
    }
    return canonical;
}

bool FederationRegistry::Register(const std::string& code, const std::string& name, EngineError* error) {
    const std::string canonical = Canonicalize(code);
    if (canonical.empty()) {
        return Fail(error, ErrorKind::kInvalidArgument, "Federation code must not be empty");
    }
    if (federations_.count(canonical) != 0) {
        return Fail(error, ErrorKind::kDuplicateFederationCode, "Federation '" + canonical + "' already registered");
    }
    federations_.emplace(canonical, Federation{canonical, name});
    return true;
}

bool FederationRegistry::RegisterDefaults(EngineError* error) {
    return Register("FIDE", "International Chess Federation", error) &&
           Register("USCF", "US Chess Federation", error) &&
           Register("CFC", "Chess Federation of Canada", error);
}

bool FederationRegistry::Lookup(const std::string& code, Federation& out, EngineError* error) const {
    const auto it = federations_.find(Canonicalize(code));
    if (it == federations_.end()) {
        return Fail(error, ErrorKind::kUnknownFederationCode, "Unknown federation code: " + code);
    }
    out = it->second;
    return true;
}

bool FederationRegistry::Contains(const std::string& code) const {
    return federations_.count(Canonicalize(code)) != 0;
}

void FederationRegistry::Clear() {
    federations_.clear();
}

std::vector<Federation> FederationRegistry::All() const {
    std::vector<Federation> all;
    all.reserve(federations_.size());
    for (const auto& entry : federations_) {
        all.push_back(entry.second);
    }
    return all;
}

}  // namespace gambit::core::model
