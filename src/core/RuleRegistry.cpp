#include "RuleRegistry.h"
#include "Logging.h"
#include <algorithm>
#include <cctype>

namespace secret_guard {

namespace {

struct RuleSpec {
    const char* name;
    const char* expression;
    bool icase;
    std::vector<std::string> excluded_prefixes;
    std::vector<std::string> triggers;
};

// Order matters: broad shapes (Generic Token, Auth0 Secret Pattern) sit after the
// specific ones so the specific name wins on lines both would match.
// Every repetition is bounded: libstdc++ regex recurses once per repeated character,
// so an open-ended run over a long minified line exhausts the stack. Only "matches
// somewhere in the line" is needed, so trailing runs are cut to their minimum.
const std::vector<RuleSpec>& default_specs() {
    static const std::vector<RuleSpec> specs = {
        {"AWS Key", R"(AKIA[0-9A-Z]{16})", false, {}, {"AKIA"}},
        {"AWS Secret", R"([A-Za-z0-9/+]{40}(?![A-Za-z0-9/+=]))", false,
            {"sha512-", "sha384-", "sha256-", "sha1-"}, {}},
        {"Private Key", R"(-----BEGIN (RSA|DSA|EC|OPENSSH) PRIVATE KEY-----)", false, {}, {"-----BEGIN "}},
        {"SSH Key", R"(ssh-rsa\s{1,16}[A-Za-z0-9+/])", false, {}, {"ssh-rsa"}},
        {"GitHub Token", R"(github[_\-\s.]?token[\s:="']{0,16}[a-z0-9]{35})", true, {}, {"github"}},
        {"API Key", R"(api[_\-\s.]?key[\s:="']{0,16}[a-z0-9]{16})", true, {}, {"api"}},
        {"Generic Secret", R"(secret[\s:="']{0,16}[a-z0-9]{16})", true, {}, {"secret"}},
        {"Password Assignment", R"((password|passwd|pwd)\s{0,16}[=:]\s{0,16}\S)", true, {}, {"pass", "pwd"}},
        {"Authorization Header", R"(authorization["'\]]{0,4}\s{0,16}[:=]\s{0,16}["']?bearer\s{1,16}[A-Za-z0-9\-._~+/])", true, {}, {"authorization"}},
        {"Connection String", R"([A-Za-z][A-Za-z0-9+.\-]{0,31}://[^\s:@/]{3,20}:[^\s:@/]{3,20}@[^\s/:])", false, {}, {"://"}},
        {"Generic Token", R"(\b[a-z0-9]{32,64}\b)", false, {}, {}},
        {"Auth0 Client Secret", R"(client[_\-\s.]?secret["']?\s{0,16}[:=]\s{0,16}["']?[A-Za-z0-9_]{64})", true, {}, {"client"}},
        {"Auth0 Secret Pattern", R"(\b[A-Za-z0-9_]{64}\b)", false, {}, {}},
        {"Stripe Live Key", R"(sk_live_[0-9a-zA-Z]{10})", false, {}, {"sk_live_"}},
    };
    return specs;
}

} // end anonymous namespace

void RuleRegistry::add(const std::string& name, const std::string& expression, bool icase,
                       std::vector<std::string> excluded_prefixes, std::vector<std::string> triggers) {
    if(name.empty()) throw RuleError(name, "empty rule name");
    if(find(name)) throw RuleError(name, "duplicate rule name");
    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if(icase) flags |= std::regex::icase;
    Rule r;
    r.name = name;
    r.expression = expression;
    try {
        r.pattern = std::regex(expression, flags);
    } catch(const std::regex_error& ex) {
        throw RuleError(name, std::string("invalid pattern: ") + ex.what());
    }
    r.excluded_prefixes = std::move(excluded_prefixes);
    r.icase = icase;
    for(auto& t : triggers) {
        if(t.empty()) throw RuleError(name, "empty trigger");
        if(icase) std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    }
    r.triggers = std::move(triggers);
    rules_.push_back(std::move(r));
}

const Rule* RuleRegistry::find(const std::string& name) const {
    auto it = std::find_if(rules_.begin(), rules_.end(), [&](const Rule& r){ return r.name == name; });
    return it == rules_.end() ? nullptr : &*it;
}

std::vector<std::string> RuleRegistry::default_rule_names() {
    std::vector<std::string> names;
    for(const auto& s : default_specs()) names.emplace_back(s.name);
    return names;
}

RuleRegistry RuleRegistry::build_default(const std::vector<std::string>& disabled) {
    auto names = default_rule_names();
    for(const auto& d : disabled) {
        if(std::find(names.begin(), names.end(), d) == names.end()) throw RuleError(d, "unknown rule name");
    }
    RuleRegistry registry;
    for(const auto& s : default_specs()) {
        if(std::find(disabled.begin(), disabled.end(), s.name) != disabled.end()) {
            Logger::instance().debug(std::string("rule disabled: ") + s.name);
            continue;
        }
        registry.add(s.name, s.expression, s.icase, s.excluded_prefixes, s.triggers);
    }
    Logger::instance().trace("rule registry ready with " + std::to_string(registry.size()) + " rules");
    return registry;
}

} // namespace secret_guard
