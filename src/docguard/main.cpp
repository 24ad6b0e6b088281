#include "docguard/cli/router.hpp"

int main(int argc, char** argv) {
  return docguard::cli::Dispatch(argc, argv);
}
