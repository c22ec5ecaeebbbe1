#include "siteaudit/cli/router.hpp"

int main(int argc, char** argv) {
  return siteaudit::cli::Dispatch(argc, argv);
}
