#include "bugreportd/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing and output/exit-code contracts live in the CLI router.
  return bugreportd::cli::Dispatch(argc, argv);
}
