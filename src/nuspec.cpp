#include "nuspec.h"

#include "errors.h"
#include "util.h"

#include <cctype>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace refpack {

namespace {

struct xml_attribute {
  std::string name;
  std::string value;
};

struct xml_token {
  enum class kind { start, end, text, eof } type{ kind::eof };
  std::string name;  // local name, namespace prefix stripped
  std::vector<xml_attribute> attributes;
  std::string text;
  bool self_closing{ false };

  std::string const *attribute(std::string_view key) const {
    for (auto const &a : attributes) {
      if (a.name == key) { return &a.value; }
    }
    return nullptr;
  }
};

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::string decode_entities(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i{ 0 }; i < raw.size(); ++i) {
    if (raw[i] != '&') {
      out.push_back(raw[i]);
      continue;
    }
    auto const semi{ raw.find(';', i) };
    if (semi == std::string_view::npos) { throw parse_error("nuspec: unterminated entity"); }
    std::string_view const entity{ raw.substr(i + 1, semi - i - 1) };
    if (entity == "amp") {
      out.push_back('&');
    } else if (entity == "lt") {
      out.push_back('<');
    } else if (entity == "gt") {
      out.push_back('>');
    } else if (entity == "quot") {
      out.push_back('"');
    } else if (entity == "apos") {
      out.push_back('\'');
    } else if (entity.size() > 1 && entity[0] == '#') {
      bool const hex{ entity[1] == 'x' || entity[1] == 'X' };
      std::string const digits{ entity.substr(hex ? 2 : 1) };
      if (digits.empty()) { throw parse_error("nuspec: bad character reference"); }
      std::size_t used{ 0 };
      unsigned long cp{ 0 };
      try {
        cp = std::stoul(digits, &used, hex ? 16 : 10);
      } catch (std::exception const &) {
        throw parse_error("nuspec: bad character reference");
      }
      if (used != digits.size() || cp > 0x10FFFF) {
        throw parse_error("nuspec: bad character reference");
      }
      append_utf8(out, static_cast<std::uint32_t>(cp));
    } else {
      throw parse_error("nuspec: unknown entity &" + std::string{ entity } + ";");
    }
    i = semi;
  }
  return out;
}

std::string local_name(std::string_view qualified) {
  auto const colon{ qualified.find(':') };
  return std::string{ colon == std::string_view::npos ? qualified
                                                      : qualified.substr(colon + 1) };
}

bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.' ||
         c == ':';
}

// Forward-only tokenizer for the well-formed subset of XML nuspec files use.
class xml_scanner {
 public:
  explicit xml_scanner(std::string_view doc) : doc_{ doc } {}

  xml_token next() {
    while (pos_ < doc_.size()) {
      if (doc_[pos_] != '<') { return read_text(); }
      if (starts_with("<?")) {
        skip_past("?>");
      } else if (starts_with("<!--")) {
        skip_past("-->");
      } else if (starts_with("<![CDATA[")) {
        auto const begin{ pos_ + 9 };
        skip_past("]]>");
        xml_token t;
        t.type = xml_token::kind::text;
        t.text = std::string{ doc_.substr(begin, pos_ - 3 - begin) };
        return t;
      } else if (starts_with("<!")) {
        skip_past(">");
      } else if (starts_with("</")) {
        pos_ += 2;
        xml_token t;
        t.type = xml_token::kind::end;
        t.name = local_name(read_name());
        skip_space();
        expect('>');
        return t;
      } else {
        return read_start();
      }
    }
    return xml_token{};
  }

 private:
  bool starts_with(std::string_view prefix) const {
    return doc_.substr(pos_, prefix.size()) == prefix;
  }

  void skip_past(std::string_view terminator) {
    auto const found{ doc_.find(terminator, pos_) };
    if (found == std::string_view::npos) { throw parse_error("nuspec: unterminated markup"); }
    pos_ = found + terminator.size();
  }

  void skip_space() {
    while (pos_ < doc_.size() && std::isspace(static_cast<unsigned char>(doc_[pos_]))) {
      ++pos_;
    }
  }

  void expect(char c) {
    if (pos_ >= doc_.size() || doc_[pos_] != c) {
      throw parse_error(std::string{ "nuspec: expected '" } + c + "'");
    }
    ++pos_;
  }

  std::string_view read_name() {
    auto const begin{ pos_ };
    while (pos_ < doc_.size() && is_name_char(doc_[pos_])) { ++pos_; }
    if (begin == pos_) { throw parse_error("nuspec: expected a name"); }
    return doc_.substr(begin, pos_ - begin);
  }

  xml_token read_text() {
    auto const end{ doc_.find('<', pos_) };
    auto const stop{ end == std::string_view::npos ? doc_.size() : end };
    xml_token t;
    t.type = xml_token::kind::text;
    t.text = decode_entities(doc_.substr(pos_, stop - pos_));
    pos_ = stop;
    return t;
  }

  xml_token read_start() {
    ++pos_;
    xml_token t;
    t.type = xml_token::kind::start;
    t.name = local_name(read_name());

    while (true) {
      skip_space();
      if (pos_ >= doc_.size()) { throw parse_error("nuspec: unterminated start tag"); }
      if (doc_[pos_] == '>') {
        ++pos_;
        return t;
      }
      if (starts_with("/>")) {
        pos_ += 2;
        t.self_closing = true;
        return t;
      }

      xml_attribute attr;
      attr.name = local_name(read_name());
      skip_space();
      expect('=');
      skip_space();
      if (pos_ >= doc_.size() || (doc_[pos_] != '"' && doc_[pos_] != '\'')) {
        throw parse_error("nuspec: attribute value must be quoted");
      }
      char const quote{ doc_[pos_++] };
      auto const close{ doc_.find(quote, pos_) };
      if (close == std::string_view::npos) { throw parse_error("nuspec: unterminated attribute"); }
      attr.value = decode_entities(doc_.substr(pos_, close - pos_));
      pos_ = close + 1;
      t.attributes.push_back(std::move(attr));
    }
  }

  std::string_view doc_;
  std::size_t pos_{ 0 };
};

package_dependency make_dependency(xml_token const &tok) {
  auto const *id{ tok.attribute("id") };
  if (!id || util_trim(*id).empty()) { throw parse_error("nuspec: dependency without id"); }
  auto const *range{ tok.attribute("version") };
  return package_dependency{ std::string{ util_trim(*id) },
                             range ? version_range::parse(*range) : version_range{} };
}

std::vector<framework> parse_framework_list(std::string const *value) {
  std::vector<framework> result;
  if (!value) { return result; }
  for (auto const &name : util_split(*value, ',')) { result.push_back(framework::parse(name)); }
  return result;
}

}  // namespace

nuspec nuspec::parse(std::string_view xml) {
  nuspec result;
  std::optional<std::string> id;
  std::optional<std::string> version;

  xml_scanner scanner{ xml };
  std::vector<std::string> stack;
  std::string text;

  for (auto tok{ scanner.next() }; tok.type != xml_token::kind::eof; tok = scanner.next()) {
    switch (tok.type) {
      case xml_token::kind::start: {
        std::string const parent{ stack.empty() ? std::string{} : stack.back() };

        if (tok.name == "group" && parent == "dependencies") {
          auto const *tfm{ tok.attribute("targetFramework") };
          result.dependency_groups.push_back(dependency_group{
              tfm && !util_trim(*tfm).empty() ? framework::parse(*tfm)
                                              : framework::any_framework(),
              {} });
        } else if (tok.name == "dependency" && parent == "group") {
          if (result.dependency_groups.empty()) {
            throw parse_error("nuspec: dependency outside of a group");
          }
          result.dependency_groups.back().dependencies.push_back(make_dependency(tok));
        } else if (tok.name == "dependency" && parent == "dependencies") {
          auto it{ result.dependency_groups.begin() };
          while (it != result.dependency_groups.end() && it->target_framework) { ++it; }
          if (it == result.dependency_groups.end()) {
            result.dependency_groups.push_back(dependency_group{ std::nullopt, {} });
            it = std::prev(result.dependency_groups.end());
          }
          it->dependencies.push_back(make_dependency(tok));
        } else if (tok.name == "frameworkAssembly" && parent == "frameworkAssemblies") {
          auto const *name{ tok.attribute("assemblyName") };
          if (!name || util_trim(*name).empty()) {
            throw parse_error("nuspec: frameworkAssembly without assemblyName");
          }
          result.framework_assemblies.push_back(framework_assembly{
              std::string{ util_trim(*name) },
              parse_framework_list(tok.attribute("targetFramework")) });
        }

        if (!tok.self_closing) {
          stack.push_back(tok.name);
          text.clear();
        }
        break;
      }

      case xml_token::kind::end: {
        if (stack.empty() || stack.back() != tok.name) {
          throw parse_error("nuspec: mismatched closing tag </" + tok.name + ">");
        }
        if (stack.size() >= 2 && stack[stack.size() - 2] == "metadata") {
          if (tok.name == "id") {
            id = std::string{ util_trim(text) };
          } else if (tok.name == "version") {
            version = std::string{ util_trim(text) };
          }
        }
        stack.pop_back();
        text.clear();
        break;
      }

      case xml_token::kind::text: text += tok.text; break;
      case xml_token::kind::eof: break;
    }
  }

  if (!stack.empty()) { throw parse_error("nuspec: unclosed element <" + stack.back() + ">"); }
  if (!id || id->empty()) { throw parse_error("nuspec: missing <id>"); }
  if (!version) { throw parse_error("nuspec: missing <version>"); }

  result.id = std::move(*id);
  result.version = package_version::parse(*version);
  return result;
}

std::vector<package_dependency> nuspec::dependencies_for(framework const &target) const {
  std::vector<package_dependency> result;
  std::vector<framework> candidates;
  std::vector<std::size_t> candidate_groups;

  for (std::size_t i{ 0 }; i < dependency_groups.size(); ++i) {
    auto const &group{ dependency_groups[i] };
    if (!group.target_framework) {
      result.insert(result.end(), group.dependencies.begin(), group.dependencies.end());
    } else {
      candidates.push_back(*group.target_framework);
      candidate_groups.push_back(i);
    }
  }

  if (auto const nearest{ framework_nearest(target, candidates) }) {
    auto const &deps{ dependency_groups[candidate_groups[*nearest]].dependencies };
    result.insert(result.end(), deps.begin(), deps.end());
  }
  return result;
}

}  // namespace refpack
