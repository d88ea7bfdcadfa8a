#include <pgrails/text_extractor.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <iterator>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace {

bool IsWordCharacter(char character) {
  const auto value = static_cast<unsigned char>(character);
  return std::isalnum(value) != 0 || character == '_';
}

std::size_t SkipQuoted(const std::string &content, std::size_t position) {
  const auto quote = content[position];
  for (++position; position < content.size(); ++position) {
    if (content[position] == '\\') {
      ++position;
      continue;
    }
    if (content[position] == quote) {
      return position + 1;
    }
  }
  return content.size();
}

std::size_t SkipComment(const std::string &content, std::size_t position) {
  const auto newline = content.find('\n', position);
  return newline == std::string::npos ? content.size() : newline;
}

// First `end` keyword at or after `position` that is not part of a longer
// word, a string literal or a comment.
std::size_t FindBlockEnd(const std::string &content, std::size_t position) {
  while (position < content.size()) {
    const auto character = content[position];
    if (character == '"' || character == '\'') {
      position = SkipQuoted(content, position);
      continue;
    }
    if (character == '#') {
      position = SkipComment(content, position);
      continue;
    }
    if (content.compare(position, 3, "end") == 0 &&
        (position == 0 || !IsWordCharacter(content[position - 1])) &&
        (position + 3 >= content.size() ||
         !IsWordCharacter(content[position + 3]))) {
      return position;
    }
    ++position;
  }
  return std::string::npos;
}

int LineAt(const std::string &content, std::size_t offset) {
  return 1 + static_cast<int>(std::count(
                 content.begin(),
                 content.begin() + static_cast<std::ptrdiff_t>(offset), '\n'));
}

std::vector<std::string> CaptureAll(const std::string &text,
                                    const std::regex &pattern,
                                    std::size_t group) {
  std::vector<std::string> captures;
  for (std::sregex_iterator match(text.begin(), text.end(), pattern), end;
       match != end; ++match) {
    captures.push_back((*match)[group].str());
  }
  return captures;
}

} // namespace

namespace pgrails {

std::vector<std::string> SplitLines(const std::string &content) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const auto newline = content.find('\n', start);
    auto line = content.substr(start, newline == std::string::npos
                                          ? std::string::npos
                                          : newline - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    if (newline == std::string::npos) {
      break;
    }
    start = newline + 1;
  }
  return lines;
}

std::vector<TableBlock> ExtractTableBlocks(const std::string &content) {
  static const std::regex header_regex(R"re(create_table\s+"(\w+)")re");
  static const std::regex open_regex(R"(do\s*\|t\|)");

  struct Header {
    std::string name;
    std::size_t begin = 0;
    std::size_t end = 0;
  };
  std::vector<Header> headers;
  for (std::sregex_iterator match(content.begin(), content.end(),
                                  header_regex),
       last;
       match != last; ++match) {
    const auto begin = static_cast<std::size_t>(match->position(0));
    headers.push_back({(*match)[1].str(), begin,
                       begin + static_cast<std::size_t>(match->length(0))});
  }

  std::vector<TableBlock> blocks;
  for (std::size_t i = 0; i < headers.size(); ++i) {
    const auto search_end =
        i + 1 < headers.size() ? headers[i + 1].begin : content.size();
    const auto search_begin =
        content.begin() + static_cast<std::ptrdiff_t>(headers[i].end);
    std::smatch open;
    if (!std::regex_search(
            search_begin,
            content.begin() + static_cast<std::ptrdiff_t>(search_end), open,
            open_regex)) {
      continue;
    }
    const auto body_begin =
        headers[i].end + static_cast<std::size_t>(open.position(0)) +
        static_cast<std::size_t>(open.length(0));
    const auto body_end = FindBlockEnd(content, body_begin);
    if (body_end == std::string::npos) {
      continue;
    }
    blocks.push_back(
        {headers[i].name, content.substr(body_begin, body_end - body_begin)});
  }
  return blocks;
}

std::vector<ColumnDeclaration> ExtractColumns(const std::string &body) {
  static const std::regex column_regex(R"re(t\.(\w+)\s+"(\w+)")re");
  std::vector<ColumnDeclaration> columns;
  for (std::sregex_iterator match(body.begin(), body.end(), column_regex), end;
       match != end; ++match) {
    columns.push_back({(*match)[1].str(), (*match)[2].str()});
  }
  return columns;
}

std::vector<std::string> ExtractForeignKeyColumns(const std::string &body) {
  static const std::regex foreign_key_regex(R"re(t\.\w+\s+"(\w+_id)")re");
  return CaptureAll(body, foreign_key_regex, 1);
}

std::vector<IndexDeclaration>
ExtractIndexDeclarations(const std::string &content) {
  static const std::regex index_regex(
      R"re(add_index\s+"(\w+)",\s+\[?"(\w+)"?\]?)re");
  std::vector<IndexDeclaration> indexes;
  for (std::sregex_iterator match(content.begin(), content.end(), index_regex),
       end;
       match != end; ++match) {
    indexes.push_back({(*match)[1].str(), (*match)[2].str()});
  }
  return indexes;
}

std::vector<std::string> ExtractInlineIndexColumns(const std::string &body) {
  static const std::regex inline_index_regex(
      R"re(t\.index\s+\[?\s*"(\w+)")re");
  return CaptureAll(body, inline_index_regex, 1);
}

std::vector<WhereFilter> ExtractWhereFilters(const std::string &content) {
  static const std::regex keyword_regex(R"(\.where\(\s*(\w+):\s*)");
  static const std::regex condition_regex(R"re(\.where\(["'](\w+)\s*=)re");

  std::vector<std::pair<std::size_t, std::string>> matches;
  for (const auto *pattern : {&keyword_regex, &condition_regex}) {
    for (std::sregex_iterator match(content.begin(), content.end(), *pattern),
         end;
         match != end; ++match) {
      matches.emplace_back(static_cast<std::size_t>(match->position(0)),
                           (*match)[1].str());
    }
  }
  std::sort(matches.begin(), matches.end());

  std::vector<WhereFilter> filters;
  filters.reserve(matches.size());
  for (const auto &[offset, column] : matches) {
    filters.push_back({column, LineAt(content, offset)});
  }
  return filters;
}

bool IsQueryFetch(const std::string &line) {
  static const std::regex fetch_regex(R"(\.(all|where|find_by|find)\b)");
  return std::regex_search(line, fetch_regex);
}

bool HasEagerLoading(const std::string &text) {
  static const std::regex eager_regex(R"(\.(includes|preload|eager_load)\b)");
  return std::regex_search(text, eager_regex);
}

std::optional<std::string> ExtractInstanceAssignment(const std::string &line) {
  static const std::regex assignment_regex(R"(@(\w+)\s*=)");
  std::smatch match;
  if (!std::regex_search(line, match, assignment_regex)) {
    return std::nullopt;
  }
  return match[1].str();
}

bool HasChainedMemberAccess(const std::string &line,
                            const std::string &variable) {
  if (variable.empty() ||
      !std::all_of(variable.begin(), variable.end(), IsWordCharacter)) {
    return false;
  }
  const std::regex chain_regex("@" + variable + R"(\.\w+\.\w+)");
  return std::regex_search(line, chain_regex);
}

bool HasAssociationChain(const std::string &line) {
  static const std::regex chain_regex(R"(\w+\.\w+\.\w+)");
  return std::regex_search(line, chain_regex);
}

} // namespace pgrails
