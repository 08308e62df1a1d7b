#include "record/commit.hpp"

#include "diagnostic/suggest.hpp"
#include "log/log.hpp"

#include <functional>
#include <map>

namespace stencil::record {

using types::CommitOrChangeId;
using types::LabeledValue;
using types::Signature;
using types::Value;

namespace {

using CommitValue = Value<Commit>;
using KeywordBuilder = std::function<CommitValue(const CommitIndex&)>;

template <typename T, typename F> auto property(F f) -> CommitValue {
    return CommitValue::of<T>(types::Property<Commit, T>(std::move(f)));
}

auto keyword_table() -> const std::map<std::string, KeywordBuilder, std::less<>>& {
    static const std::map<std::string, KeywordBuilder, std::less<>> table = {
        {"description",
         [](const CommitIndex&) {
             return property<std::string>(
                 [](const Commit& c) { return complete_newline(c.description); });
         }},
        {"change_id",
         [](const CommitIndex& index) {
             return property<CommitOrChangeId>([ids = index.change_ids](const Commit& c) {
                 return CommitOrChangeId(c.change_id, ids);
             });
         }},
        {"commit_id",
         [](const CommitIndex& index) {
             return property<CommitOrChangeId>([ids = index.commit_ids](const Commit& c) {
                 return CommitOrChangeId(c.commit_id, ids);
             });
         }},
        {"author",
         [](const CommitIndex&) {
             return property<Signature>([](const Commit& c) { return c.author; });
         }},
        {"committer",
         [](const CommitIndex&) {
             return property<Signature>([](const Commit& c) { return c.committer; });
         }},
        {"working_copies",
         [](const CommitIndex&) {
             return property<std::string>([](const Commit& c) { return c.working_copies; });
         }},
        {"current_working_copy",
         [](const CommitIndex&) {
             return property<bool>([](const Commit& c) { return c.current_working_copy; });
         }},
        {"branches",
         [](const CommitIndex&) {
             return property<std::string>([](const Commit& c) { return c.branches; });
         }},
        {"tags",
         [](const CommitIndex&) {
             return property<std::string>([](const Commit& c) { return c.tags; });
         }},
        {"git_refs",
         [](const CommitIndex&) {
             return property<std::string>([](const Commit& c) { return c.git_refs; });
         }},
        {"git_head",
         [](const CommitIndex&) {
             return property<std::string>([](const Commit& c) { return c.git_head; });
         }},
        {"divergent",
         [](const CommitIndex&) {
             return property<bool>([](const Commit& c) { return c.divergent; });
         }},
        {"conflict",
         [](const CommitIndex&) {
             return property<bool>([](const Commit& c) { return c.conflict; });
         }},
        {"empty",
         [](const CommitIndex&) {
             return property<bool>([](const Commit& c) { return c.empty; });
         }},
    };
    return table;
}

// ============================================================================
// Records File Fields
// ============================================================================

using FieldResult = Result<bool, config::ConfigError>;
using FieldSetter = std::function<FieldResult(Commit&, const config::TomlEntry&)>;

auto string_field(std::string Commit::*member) -> FieldSetter {
    return [member](Commit& commit, const config::TomlEntry& entry) -> FieldResult {
        commit.*member = entry.value;
        return true;
    };
}

auto bool_field(bool Commit::*member) -> FieldSetter {
    return [member](Commit& commit, const config::TomlEntry& entry) -> FieldResult {
        auto value = config::entry_as_bool(entry);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        commit.*member = unwrap(value);
        return true;
    };
}

auto signature_field(Signature Commit::*member, std::string Signature::*field) -> FieldSetter {
    return [member, field](Commit& commit, const config::TomlEntry& entry) -> FieldResult {
        (commit.*member).*field = entry.value;
        return true;
    };
}

auto timestamp_millis_field(Signature Commit::*member) -> FieldSetter {
    return [member](Commit& commit, const config::TomlEntry& entry) -> FieldResult {
        auto value = config::entry_as_int(entry);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        (commit.*member).timestamp.millis_since_epoch = unwrap(value);
        return true;
    };
}

auto timestamp_tz_field(Signature Commit::*member) -> FieldSetter {
    return [member](Commit& commit, const config::TomlEntry& entry) -> FieldResult {
        auto value = config::entry_as_int(entry);
        if (is_err(value)) {
            return unwrap_err(value);
        }
        // UTC offsets stay within a day.
        if (unwrap(value) <= -24 * 60 || unwrap(value) >= 24 * 60) {
            return config::ConfigError{.message = "timezone offset out of range: " + entry.value,
                                       .line = entry.line};
        }
        (commit.*member).timestamp.tz_offset = static_cast<int32_t>(unwrap(value));
        return true;
    };
}

auto field_table() -> const std::map<std::string, FieldSetter, std::less<>>& {
    static const std::map<std::string, FieldSetter, std::less<>> table = {
        {"commit_id", string_field(&Commit::commit_id)},
        {"change_id", string_field(&Commit::change_id)},
        {"description", string_field(&Commit::description)},
        {"author_name", signature_field(&Commit::author, &Signature::name)},
        {"author_email", signature_field(&Commit::author, &Signature::email)},
        {"author_timestamp", timestamp_millis_field(&Commit::author)},
        {"author_tz", timestamp_tz_field(&Commit::author)},
        {"committer_name", signature_field(&Commit::committer, &Signature::name)},
        {"committer_email", signature_field(&Commit::committer, &Signature::email)},
        {"committer_timestamp", timestamp_millis_field(&Commit::committer)},
        {"committer_tz", timestamp_tz_field(&Commit::committer)},
        {"working_copies", string_field(&Commit::working_copies)},
        {"current_working_copy", bool_field(&Commit::current_working_copy)},
        {"branches", string_field(&Commit::branches)},
        {"tags", string_field(&Commit::tags)},
        {"git_refs", string_field(&Commit::git_refs)},
        {"git_head", string_field(&Commit::git_head)},
        {"divergent", bool_field(&Commit::divergent)},
        {"conflict", bool_field(&Commit::conflict)},
        {"empty", bool_field(&Commit::empty)},
    };
    return table;
}

auto read_commit(const config::TomlTable& table) -> Result<Commit, config::ConfigError> {
    Commit commit;
    bool has_committer = false;
    for (const auto& entry : table.entries) {
        auto it = field_table().find(entry.key);
        if (it == field_table().end()) {
            return config::ConfigError{.message = "unknown commit field `" + entry.key + "`",
                                       .line = entry.line};
        }
        auto set = it->second(commit, entry);
        if (is_err(set)) {
            return unwrap_err(set);
        }
        if (entry.key.rfind("committer_", 0) == 0) {
            has_committer = true;
        }
    }
    if (table.get("commit_id") == nullptr) {
        return config::ConfigError{.message = "commit is missing `commit_id`", .line = table.line};
    }
    if (table.get("change_id") == nullptr) {
        return config::ConfigError{.message = "commit is missing `change_id`", .line = table.line};
    }
    if (!has_committer) {
        commit.committer = commit.author;
    }
    return commit;
}

auto read_commits(const std::vector<config::TomlTable>& tables)
    -> Result<std::vector<Commit>, config::ConfigError> {
    std::vector<Commit> commits;
    for (const auto& table : tables) {
        if (table.name.empty()) {
            if (!table.entries.empty()) {
                return config::ConfigError{.message = "entries must be inside a [[commit]] table",
                                           .line = table.entries.front().line};
            }
            continue;
        }
        if (table.name != "commit" || !table.is_array_element) {
            return config::ConfigError{.message = "unexpected table `" + table.name +
                                                  "`, expected [[commit]]",
                                       .line = table.line};
        }
        auto commit = read_commit(table);
        if (is_err(commit)) {
            return unwrap_err(commit);
        }
        commits.push_back(std::move(unwrap(commit)));
    }

    STENCIL_LOG_DEBUG("config", "read " << commits.size() << " commits");
    return commits;
}

} // namespace

auto complete_newline(std::string text) -> std::string {
    if (!text.empty() && text.back() != '\n') {
        text.push_back('\n');
    }
    return text;
}

auto commit_keywords() -> const std::vector<std::string>& {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> result;
        for (const auto& [name, builder] : keyword_table()) {
            result.push_back(name);
        }
        return result;
    }();
    return names;
}

auto build_commit_index(const std::vector<Commit>& commits) -> CommitIndex {
    std::vector<std::string> commit_ids;
    std::vector<std::string> change_ids;
    commit_ids.reserve(commits.size());
    change_ids.reserve(commits.size());
    for (const auto& commit : commits) {
        commit_ids.push_back(commit.commit_id);
        change_ids.push_back(commit.change_id);
    }
    return CommitIndex{
        .commit_ids = make_rc<types::SortedIdIndex>(std::move(commit_ids)),
        .change_ids = make_rc<types::SortedIdIndex>(std::move(change_ids)),
    };
}

auto commit_keyword_resolver(CommitIndex index) -> builder::KeywordResolver<Commit> {
    return [index = std::move(index)](std::string_view name, const SourceSpan& span)
               -> Result<LabeledValue<Commit>, TemplateError> {
        const auto& table = keyword_table();
        auto it = table.find(name);
        if (it == table.end()) {
            return diagnostic::with_suggestion(
                TemplateError::no_such_keyword(std::string(name), span), commit_keywords());
        }
        return LabeledValue<Commit>{.value = it->second(index), .labels = {std::string(name)}};
    };
}

auto parse_commits(std::string_view content) -> Result<std::vector<Commit>, config::ConfigError> {
    auto tables = config::parse_toml(content);
    if (is_err(tables)) {
        return unwrap_err(tables);
    }
    return read_commits(unwrap(tables));
}

auto load_commits(const std::string& path) -> Result<std::vector<Commit>, config::ConfigError> {
    auto tables = config::load_toml_file(path);
    if (is_err(tables)) {
        return unwrap_err(tables);
    }
    auto commits = read_commits(unwrap(tables));
    if (is_err(commits)) {
        auto err = unwrap_err(commits);
        err.message = path + ": " + err.message;
        return err;
    }
    return commits;
}

} // namespace stencil::record
