#include "util/misc.hpp"

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string join(const std::vector<std::string>& parts,
                 const std::string& sep) {
  std::string res;
  for (size_t i = 0; i < parts.size(); i++) {
    if (i != 0) res += sep;
    res += parts[i];
  }
  return res;
}

std::string trimLeft(const std::string& s, char c) {
  size_t pos = s.find_first_not_of(c);
  if (pos == std::string::npos) return "";
  return s.substr(pos);
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p;
    return true;
  };
};

}  // namespace util
