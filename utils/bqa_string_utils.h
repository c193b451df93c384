#ifndef BQA_STRING_UTILS_H
#define BQA_STRING_UTILS_H

#include <string>
#include <vector>

namespace bqa {

namespace detail {

// UTF-8 encodings of the non-ASCII white space code points: NEL, NBSP,
// OGHAM SPACE MARK, U+2000..U+200A, LS, PS, NNBSP, MMSP, IDEOGRAPHIC SPACE.
inline const std::vector<std::string>& unicode_spaces()
{
  static const std::vector<std::string> spaces = {
    "\xC2\x85", "\xC2\xA0", "\xE1\x9A\x80",
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",
    "\xE2\x80\xA8", "\xE2\x80\xA9", "\xE2\x80\xAF", "\xE2\x81\x9F",
    "\xE3\x80\x80"
  };
  return spaces;
}

inline bool is_ascii_space(char c)
{
  return c == ' ' || (c >= '\t' && c <= '\r') || (c >= '\x1C' && c <= '\x1F');
}

// Byte length of the white space code point starting at begin, 0 if none.
inline size_t space_at(const std::string& str, size_t begin, size_t end)
{
  if (is_ascii_space(str[begin])) return 1;
  for (const auto& space : unicode_spaces()) {
    if (end - begin >= space.size() && str.compare(begin, space.size(), space) == 0) return space.size();
  }
  return 0;
}

// Byte length of the white space code point ending just before end, 0 if none.
inline size_t space_before(const std::string& str, size_t begin, size_t end)
{
  if (is_ascii_space(str[end - 1])) return 1;
  for (const auto& space : unicode_spaces()) {
    if (end - begin >= space.size() && str.compare(end - space.size(), space.size(), space) == 0) return space.size();
  }
  return 0;
}

} // namespace detail

// Strips ASCII and Unicode white space from both ends of a UTF-8 string.
inline std::string trim(const std::string& str)
{
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end) {
    size_t n = detail::space_at(str, begin, end);
    if (n == 0) break;
    begin += n;
  }
  while (end > begin) {
    size_t n = detail::space_before(str, begin, end);
    if (n == 0) break;
    end -= n;
  }
  return str.substr(begin, end - begin);
}

inline bool starts_with(const std::string& str, const std::string& prefix)
{
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& str, const std::string& suffix)
{
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Replaces the leading prefix "from" by "to". Returns false if str does not start with "from".
inline bool replace_prefix(std::string& str, const std::string& from, const std::string& to)
{
  if (!starts_with(str, from)) return false;
  str.replace(0, from.size(), to);
  return true;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& delim)
{
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += delim;
    out += parts[i];
  }
  return out;
}

} // namespace bqa

#endif // BQA_STRING_UTILS_H
