#include "camgate/cli/router.hpp"

int main(int argc, char** argv) {
  return camgate::cli::Dispatch(argc, argv);
}
