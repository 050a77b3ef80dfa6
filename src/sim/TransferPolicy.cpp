#include "TransferPolicy.hpp"
#include "Errors.hpp"
#include "NaivePolicy.hpp"
#include "SmartPolicy.hpp"
#include <cctype>

std::unique_ptr<TransferPolicy> makePolicy(PolicyKind kind)
{
    switch (kind) {
    case PolicyKind::Naive:
        return std::make_unique<NaivePolicy>();
    case PolicyKind::Smart:
        return std::make_unique<SmartPolicy>();
    }
    throw ConfigurationError("unknown transfer policy");
}

const char* policyName(PolicyKind kind)
{
    switch (kind) {
    case PolicyKind::Naive: return "naive";
    case PolicyKind::Smart: return "smart";
    }
    return "unknown";
}

PolicyKind parsePolicyKind(const std::string& name)
{
    std::string lower = name;
    for (char &c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "naive") return PolicyKind::Naive;
    if (lower == "smart") return PolicyKind::Smart;
    throw ConfigurationError("unknown transfer policy '" + name + "' (expected naive or smart)");
}
