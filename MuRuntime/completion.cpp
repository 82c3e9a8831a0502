#include "MuRuntime.h"

namespace MuRuntime {

namespace {

const char* const kBuiltins[] = {
    "print", "len", "range", "int", "float", "str", "repr", "bool", "abs", "min", "max",
    "round", "list", "sorted", "sum", "dir", "type", "isinstance",
    "BaseException", "Exception", "ValueError", "TypeError", "RuntimeError", "NameError",
    "IndexError", "KeyError", "AttributeError", "ZeroDivisionError", "ImportError",
    "OSError", "MemoryError", "KeyboardInterrupt", "NotImplementedError", "OverflowError",
    "StopIteration", "AssertionError", "LookupError", "ArithmeticError",
};

const char* const kKeywords[] = {
    "False", "None", "True", "and", "break", "continue", "def", "elif", "else", "except",
    "finally", "for", "from", "global", "if", "import", "in", "is", "not", "or", "pass",
    "raise", "return", "try", "while",
};

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

std::string trailing_token(const std::string& input, size_t cursor) {
    if (cursor > input.size()) cursor = input.size();
    size_t start = cursor;
    while (start > 0) {
        char c = input[start - 1];
        if (std::isspace(static_cast<unsigned char>(c)) || c == '.') break;
        --start;
    }
    return input.substr(start, cursor - start);
}

// ============================================================================
// ModuleCompletionProvider
// ============================================================================

ModuleCompletionProvider::ModuleCompletionProvider() {
    for (const char* n : kBuiltins) top_level_.push_back(n);
    for (const char* n : kKeywords) top_level_.push_back(n);

    std::vector<std::string> board_members;
    for (int i = 0; i <= 13; ++i) board_members.push_back("D" + std::to_string(i));
    board_members.insert(board_members.end(), {"A0", "A1", "A2", "LED", "board_id"});

    add_module("board", board_members);
    add_module("digitalio", {"DigitalInOut", "Direction", "Pull"});
    add_module("time", {"sleep", "monotonic", "monotonic_ns", "time"});
    add_module("math", {"pi", "e", "sin", "cos", "tan", "exp", "fabs", "sqrt", "log", "pow",
                        "floor", "ceil"});
    add_module("Direction", {"INPUT", "OUTPUT"});
    add_module("Pull", {"UP", "DOWN"});
}

void ModuleCompletionProvider::add_names(const std::vector<std::string>& names) {
    for (const auto& n : names) {
        if (std::find(top_level_.begin(), top_level_.end(), n) == top_level_.end())
            top_level_.push_back(n);
    }
}

void ModuleCompletionProvider::add_module(const std::string& module, const std::vector<std::string>& members) {
    members_[module] = members;
    // Enum-like classes are reached through their module, not imported bare
    if (module != "Direction" && module != "Pull") add_names({module});
}

std::vector<std::string> ModuleCompletionProvider::complete(const std::string& input, size_t cursor) {
    if (cursor > input.size()) cursor = input.size();
    std::string token = trailing_token(input, cursor);
    size_t token_start = cursor - token.size();

    if (token_start > 0 && input[token_start - 1] == '.') {
        size_t end = token_start - 1;
        size_t begin = end;
        while (begin > 0 && is_ident_char(input[begin - 1])) --begin;
        std::string owner = input.substr(begin, end - begin);
        auto it = members_.find(owner);
        if (it == members_.end()) return {};
        return rank(token, it->second);
    }

    if (token.empty()) return {};
    return rank(token, top_level_);
}

std::vector<std::string> ModuleCompletionProvider::rank(const std::string& token, const std::vector<std::string>& pool) {
    std::string ltoken = lower(token);
    std::vector<std::string> out;
    for (const auto& name : pool) {
        if (lower(name).compare(0, ltoken.size(), ltoken) == 0) out.push_back(name);
    }

    auto exact = [&](const std::string& s) { return s.compare(0, token.size(), token) == 0; };
    std::sort(out.begin(), out.end(), [&](const std::string& a, const std::string& b) {
        bool ea = exact(a), eb = exact(b);
        if (ea != eb) return ea;
        if (a.size() != b.size()) return a.size() < b.size();
        return a < b;
    });
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

// ============================================================================
// CompletionCycle
// ============================================================================

CompletionCycle::CompletionCycle(CompletionProvider& provider)
    : provider_(provider), active_(false), index_(0) {}

std::optional<std::string> CompletionCycle::next(const std::string& input, size_t cursor, size_t* new_cursor) {
    if (active_) {
        index_ = (index_ + 1) % candidates_.size();
        return compose(new_cursor);
    }

    if (cursor > input.size()) cursor = input.size();
    candidates_ = provider_.complete(input, cursor);
    if (candidates_.empty()) return std::nullopt;

    std::string token = trailing_token(input, cursor);
    head_ = input.substr(0, cursor - token.size());
    tail_ = input.substr(cursor);
    index_ = 0;
    active_ = true;
    return compose(new_cursor);
}

void CompletionCycle::reset() {
    active_ = false;
    index_ = 0;
    candidates_.clear();
    head_.clear();
    tail_.clear();
}

std::string CompletionCycle::compose(size_t* new_cursor) const {
    const std::string& pick = candidates_[index_];
    if (new_cursor) *new_cursor = head_.size() + pick.size();
    return head_ + pick + tail_;
}

} // namespace MuRuntime
