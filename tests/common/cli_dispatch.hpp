#ifndef SITEAUDIT_TESTS_COMMON_CLI_DISPATCH_HPP_
#define SITEAUDIT_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "siteaudit/cli/router.hpp"

#include <string>
#include <vector>

namespace siteaudit::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return siteaudit::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

} // namespace siteaudit::tests::common

#endif // SITEAUDIT_TESTS_COMMON_CLI_DISPATCH_HPP_
