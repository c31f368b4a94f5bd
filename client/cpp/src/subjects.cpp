#include "lattice/subjects.hpp"

#include <cctype>
#include <vector>

namespace lattice {
namespace subjects {

namespace {

std::vector<std::string> split_tokens(const std::string& subject) {
    std::vector<std::string> tokens;
    std::string::size_type start = 0;
    while (true) {
        auto pos = subject.find('.', start);
        if (pos == std::string::npos) {
            tokens.push_back(subject.substr(start));
            break;
        }
        tokens.push_back(subject.substr(start, pos - start));
        start = pos + 1;
    }
    return tokens;
}

} // anonymous namespace

std::string prefix(const std::string& lattice_namespace) {
    if (lattice_namespace.empty()) {
        return ROOT;
    }
    return std::string(ROOT) + "." + lattice_namespace;
}

std::string inventory(const std::string& lattice_namespace, InventoryKind kind, const Scope& scope) {
    std::string subject = prefix(lattice_namespace) + "." + INVENTORY + "." + to_string(kind);
    switch (scope.type) {
        case Scope::Type::All:
            return subject;
        case Scope::Type::Host:
            return subject + ".host." + scope.target;
        case Scope::Type::Workload:
            return subject + ".workload." + scope.target;
    }
    return subject;
}

std::string auction(const std::string& lattice_namespace) {
    // e.g. wasmbus.control.auction.request
    return prefix(lattice_namespace) + "." + CONTROL + "." + AUCTION_REQUEST;
}

std::string launch_actor(const std::string& lattice_namespace, const std::string& host_id) {
    // e.g. wasmbus.control.Nxxxx.actor.launch
    return prefix(lattice_namespace) + "." + CONTROL + "." + host_id + "." + LAUNCH_ACTOR;
}

std::string terminate_actor(const std::string& lattice_namespace, const std::string& host_id) {
    return prefix(lattice_namespace) + "." + CONTROL + "." + host_id + "." + TERMINATE_ACTOR;
}

std::string events(const std::string& lattice_namespace) {
    return prefix(lattice_namespace) + "." + EVENTS;
}

std::string reply_inbox(const std::string& correlation_id) {
    return std::string(INBOX_PREFIX) + "." + correlation_id;
}

std::string request_subject(const std::string& lattice_namespace, const QueryRequest& request) {
    if (request.kind == InventoryKind::Auction) {
        return auction(lattice_namespace);
    }
    return inventory(lattice_namespace, request.kind, request.scope);
}

bool matches(const std::string& pattern, const std::string& subject) {
    auto pattern_tokens = split_tokens(pattern);
    auto subject_tokens = split_tokens(subject);

    std::size_t i = 0;
    for (; i < pattern_tokens.size(); ++i) {
        const auto& token = pattern_tokens[i];
        if (token == ">") {
            // Needs at least one remaining token and must be last.
            return i + 1 == pattern_tokens.size() && i < subject_tokens.size();
        }
        if (i >= subject_tokens.size()) {
            return false;
        }
        if (token != "*" && token != subject_tokens[i]) {
            return false;
        }
    }
    return i == subject_tokens.size();
}

bool is_valid_token(const std::string& token) {
    if (token.empty()) return false;
    for (unsigned char c : token) {
        if (c == '.' || c == '*' || c == '>' || std::isspace(c) || std::iscntrl(c)) {
            return false;
        }
    }
    return true;
}

} // namespace subjects
} // namespace lattice
