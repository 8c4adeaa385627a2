#include "missionline/cli/router.hpp"

int main(int argc, char** argv) {
  return missionline::cli::Dispatch(argc, argv);
}
