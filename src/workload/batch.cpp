/**
 * @file batch.cpp
 * @brief Batch loading with toml++.
 * @author CodeVerdict contributors
 */

#include "workload/batch.hpp"

#include "core/text.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include <toml++/toml.hpp>

namespace code_verdict {

namespace {

bool is_tag_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0
        || c == '_' || c == '+' || c == '-';
}

Result<BatchItem> parse_item(const toml::table& table, const std::string& context) {
    BatchItem item;
    item.id = table["id"].value_or(std::string{});
    if (trim(item.id).empty()) {
        return Error{ErrorCode::Serialization, context + ": missing or empty 'id'"};
    }

    auto code = table["code"].value<std::string>();
    if (!code) {
        return Error{ErrorCode::Serialization, context + " ('" + item.id + "'): missing 'code'"};
    }
    item.code = clean_code(*code);

    if (const auto* assertions = table["assertions"].as_array()) {
        for (const auto& node : *assertions) {
            auto text = node.value<std::string>();
            if (!text) {
                return Error{ErrorCode::Serialization,
                             context + " ('" + item.id + "'): assertions must be strings"};
            }
            item.assertions.push_back(*text);
        }
    } else if (auto test = table["test"].value<std::string>()) {
        item.assertions = split_assertions(*test);
    }
    return item;
}

}  // namespace

Result<Batch> parse_batch(std::string_view text, std::string_view origin) {
    toml::table root;
    try {
        root = toml::parse(text, origin);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Serialization,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    Batch batch;
    if (auto header = root["batch"]; header.is_table()) {
        batch.name = header["name"].value_or(std::string{});
        batch.version = header["version"].value_or(std::string{});
        batch.description = header["description"].value_or(std::string{});
    }
    if (batch.name.empty()) batch.name = std::string{origin};

    const auto tasks = root["tasks"];
    if (tasks && !tasks.is_array()) {
        return Error{ErrorCode::Serialization, "'tasks' must be an array of tables"};
    }

    if (const auto* array = tasks.as_array()) {
        std::unordered_set<std::string> seen;
        size_t index = 0;
        for (const auto& node : *array) {
            const std::string context = "tasks[" + std::to_string(index++) + "]";
            const auto* table = node.as_table();
            if (table == nullptr) return Error{ErrorCode::Serialization, context + ": expected a table"};
            auto item = parse_item(*table, context);
            if (!item) return item.error();
            if (!seen.insert(item->id).second) {
                return Error{ErrorCode::Serialization, context + ": duplicate task id '"
                                                           + item->id + "'"};
            }
            batch.items.push_back(std::move(*item));
        }
    }
    return batch;
}

Result<Batch> load_batch(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return Error{ErrorCode::Io, "Cannot open batch file '" + path.string() + "'"};
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_batch(buffer.str(), path.stem().string());
}

std::string clean_code(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        if (text.compare(pos, 3, "```") != 0) {
            out.push_back(text[pos++]);
            continue;
        }
        pos += 3;
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) ++pos;
        while (pos < text.size() && is_tag_char(text[pos])) ++pos;
    }
    return out;
}

std::vector<std::string> split_assertions(std::string_view script) {
    std::vector<std::string> statements;
    size_t start = 0;
    while (start <= script.size()) {
        size_t end = script.find('\n', start);
        if (end == std::string_view::npos) end = script.size();
        std::string_view line = script.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        start = end + 1;

        const auto content = trim(line);
        if (content.empty() || content.front() == '#') continue;

        const bool continuation = line.front() == ' ' || line.front() == '\t';
        if (continuation && !statements.empty()) {
            statements.back() += '\n';
            statements.back() += line;
        } else {
            statements.emplace_back(content);
        }
    }
    return statements;
}

}  // namespace code_verdict
