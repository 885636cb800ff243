#include "fim/cli/router.hpp"

int main(int argc, char** argv) {
  return fim::cli::Dispatch(argc, argv);
}
