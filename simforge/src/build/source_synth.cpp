#include "build/source_synth.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace simforge::build {

// C11 keywords; an alias named like one would rewrite the callback's own syntax
static constexpr std::array<std::string_view, 44> C_KEYWORDS = {
    "auto",     "break",    "case",     "char",       "const",         "continue",
    "default",  "do",       "double",   "else",       "enum",          "extern",
    "float",    "for",      "goto",     "if",         "inline",        "int",
    "long",     "register", "restrict", "return",     "short",         "signed",
    "sizeof",   "static",   "struct",   "switch",     "typedef",       "union",
    "unsigned", "void",     "volatile", "while",      "_Alignas",      "_Alignof",
    "_Atomic",  "_Bool",    "_Complex", "_Generic",   "_Imaginary",    "_Noreturn",
    "_Static_assert",       "_Thread_local",
};

bool is_c_identifier(std::string_view name) {
    if (name.empty())
        return false;

    auto first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_')
        return false;

    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_')
            return false;
    }

    return std::find(C_KEYWORDS.begin(), C_KEYWORDS.end(), name) == C_KEYWORDS.end();
}

Result<BuildRequest, std::string> make_build_request(std::string function_source,
                                                     std::vector<std::string> aliases) {
    std::unordered_set<std::string_view> seen;
    for (const auto& alias : aliases) {
        if (!is_c_identifier(alias)) {
            return "invalid userdata alias: '" + alias + "' is not a C identifier";
        }
        if (!seen.insert(alias).second) {
            return "duplicate userdata alias: '" + alias + "'";
        }
    }
    return BuildRequest(std::move(function_source), std::move(aliases));
}

std::string render_callback_source(const BuildRequest& request, std::string_view header) {
    std::ostringstream src;
    src << "#include <stdint.h>\n";
    src << "#include <" << header << ">\n";

    const auto& aliases = request.aliases();
    for (size_t i = 0; i < aliases.size(); ++i) {
        src << "#define " << aliases[i] << " d->userdata[" << i << "]\n";
    }

    src << request.function_source();
    src << "\nuintptr_t " << CALLBACK_SYMBOL << " = (uintptr_t) " << CALLBACK_FUNCTION << ";\n";
    return src.str();
}

} // namespace simforge::build
