/**
 * @file call_site.cpp
 * @brief Caller-tag extraction from compiler function signatures.
 *
 * Handles GCC/Clang __PRETTY_FUNCTION__ and MSVC __FUNCSIG__ text, e.g.
 *   "void app::Worker::run(int)"
 *   "std::vector<int> Pool<T>::drain() [with T = Job]"
 *   "auto Worker::run()::<lambda()>"
 *   "void (anonymous namespace)::helper()"
 *
 * @copyright Copyright (c) 2024 levelog Contributors
 * @license MIT License
 */

#include "levelog/core/call_site.hpp"

#include <cctype>
#include <vector>

namespace levelog {
namespace core {

namespace {

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '>';
}

bool followsOperatorKeyword(const std::string& sig, std::size_t pos) {
    static const std::string kOperator = "operator";
    if (pos < kOperator.size() ||
        sig.compare(pos - kOperator.size(), kOperator.size(), kOperator) != 0) {
        return false;
    }
    std::size_t start = pos - kOperator.size();
    return start == 0 || !(std::isalnum(static_cast<unsigned char>(sig[start - 1])) ||
                           sig[start - 1] == '_');
}

// Position of the '(' opening the parameter list, or npos.
std::size_t findParameterList(const std::string& sig) {
    int angle = 0;

    for (std::size_t i = 0; i < sig.size(); ++i) {
        char c = sig[i];

        if (followsOperatorKeyword(sig, i)) {
            if (c == '(') {
                // operator() - parameters follow the "()"
                return (i + 2 < sig.size() && sig[i + 2] == '(') ? i + 2 : std::string::npos;
            }
            while (i < sig.size() && sig[i] != '(') {
                ++i;
            }
            if (i == sig.size()) {
                return std::string::npos;
            }
            return i;
        }

        if (c == '<') {
            ++angle;
        } else if (c == '>') {
            if (angle > 0) --angle;
        } else if (c == '(' && angle == 0) {
            if (i > 0 && isNameChar(sig[i - 1])) {
                return i;
            }
            // Grouping such as "(anonymous namespace)"
            int depth = 1;
            while (depth > 0 && ++i < sig.size()) {
                if (sig[i] == '(') ++depth;
                else if (sig[i] == ')') --depth;
            }
        }
    }

    return std::string::npos;
}

// Strips the return type and calling convention in front of the name.
std::string qualifiedName(const std::string& prefix) {
    // Conversion operators carry a space of their own: "Flag::operator bool"
    std::size_t end = prefix.size();
    std::size_t conversion = prefix.rfind("operator ");
    if (conversion != std::string::npos &&
        (conversion == 0 || !(std::isalnum(static_cast<unsigned char>(prefix[conversion - 1])) ||
                              prefix[conversion - 1] == '_'))) {
        end = conversion;
    }

    int depth = 0;
    for (std::size_t i = end; i > 0; --i) {
        char c = prefix[i - 1];
        if (c == '>' || c == ')') {
            ++depth;
        } else if (c == '<' || c == '(') {
            if (depth > 0) --depth;
        } else if (c == ' ' && depth == 0) {
            return prefix.substr(i);
        }
    }
    return prefix;
}

// "operator<<", "operator bool", "operator std::string"; not "operators"
bool isOperatorName(const std::string& part) {
    if (part.compare(0, 8, "operator") != 0) {
        return false;
    }
    return part.size() == 8 ||
           !(std::isalnum(static_cast<unsigned char>(part[8])) || part[8] == '_');
}

std::vector<std::string> splitScopes(const std::string& name) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;

    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (c == '<' || c == '(') {
            ++depth;
        } else if ((c == '>' || c == ')') && depth > 0) {
            --depth;
        } else if (c == ':' && depth == 0 && i + 1 < name.size() && name[i + 1] == ':' &&
                   !isOperatorName(current)) {
            parts.push_back(current);
            current.clear();
            ++i;
            continue;
        }
        current += c;
    }
    parts.push_back(current);
    return parts;
}

std::string stripTemplateArgs(const std::string& part) {
    if (isOperatorName(part)) {
        return part;
    }
    std::size_t angle = part.find('<');
    return angle == std::string::npos ? part : part.substr(0, angle);
}

bool isAnonymousScope(const std::string& part) {
    return part.empty() || part[0] == '{' || part[0] == '(' || part[0] == '`';
}

}  // namespace

std::string sourceStem(const char* file) {
    if (file == nullptr) {
        return "";
    }

    std::string path(file);
    std::size_t slash = path.find_last_of("/\\");
    std::string base = (slash == std::string::npos) ? path : path.substr(slash + 1);
    std::size_t dot = base.rfind('.');
    return (dot == std::string::npos || dot == 0) ? base : base.substr(0, dot);
}

std::string callerTag(const CallSite& site) {
    if (!site.resolved()) {
        return "";
    }

    std::string scope;
    std::string function = site.function ? site.function : "";

    if (site.signature != nullptr) {
        std::string sig(site.signature);

        // GCC appends template bindings: " [with T = int]"
        std::size_t with = sig.find(" [with ");
        if (with != std::string::npos) {
            sig.erase(with);
        }

        std::size_t params = findParameterList(sig);
        if (params != std::string::npos) {
            std::vector<std::string> parts = splitScopes(qualifiedName(sig.substr(0, params)));
            std::string last = stripTemplateArgs(parts.back());
            if (!last.empty()) {
                function = last;
            }
            if (parts.size() > 1) {
                const std::string& enclosing = parts[parts.size() - 2];
                if (!isAnonymousScope(enclosing)) {
                    scope = stripTemplateArgs(enclosing);
                }
            }
        }
    }

    if (scope.empty()) {
        scope = sourceStem(site.file);
    }

    std::string tag = "[";
    if (!scope.empty()) {
        tag += scope;
        tag += '.';
    }
    tag += function;
    tag += "()]:";
    tag += std::to_string(site.line);
    return tag;
}

}  // namespace core
}  // namespace levelog
