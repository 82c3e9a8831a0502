#ifndef _MuRuntime_completion_h_
#define _MuRuntime_completion_h_

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace MuRuntime {

// Substring after the last whitespace or '.' before cursor
std::string trailing_token(const std::string& input, size_t cursor);

// Completion Bridge: ranked candidates for the token under the cursor
class CompletionProvider {
public:
    virtual ~CompletionProvider() = default;
    virtual std::vector<std::string> complete(const std::string& input, size_t cursor) = 0;
};

// Static table of builtins, keywords, modules and module members.
// Ranking: case-sensitive prefix, case-insensitive prefix, length, name.
class ModuleCompletionProvider : public CompletionProvider {
public:
    ModuleCompletionProvider();

    std::vector<std::string> complete(const std::string& input, size_t cursor) override;

    // Names defined in the session, offered at top level
    void add_names(const std::vector<std::string>& names);
    void add_module(const std::string& module, const std::vector<std::string>& members);

private:
    static std::vector<std::string> rank(const std::string& token, const std::vector<std::string>& pool);

    std::vector<std::string> top_level_;
    std::map<std::string, std::vector<std::string>> members_;
};

// Tab-key state: the first request computes candidates, later requests
// step through them and wrap. Any other key must call reset().
class CompletionCycle {
public:
    explicit CompletionCycle(CompletionProvider& provider);

    // Returns the rewritten line, or nullopt when nothing matches.
    // new_cursor receives the cursor position after the candidate.
    std::optional<std::string> next(const std::string& input, size_t cursor, size_t* new_cursor = nullptr);
    void reset();

    bool active() const { return active_; }
    size_t index() const { return index_; }
    const std::vector<std::string>& candidates() const { return candidates_; }

private:
    std::string compose(size_t* new_cursor) const;

    CompletionProvider& provider_;
    bool active_;
    size_t index_;
    std::vector<std::string> candidates_;
    std::string head_;   // text before the replaced token
    std::string tail_;   // text after the cursor
};

} // namespace MuRuntime

#endif
