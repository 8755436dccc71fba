#include "minitest.hpp"

int main(int argc, char** argv) {
  return mini::run_all(argc > 1 ? std::string_view(argv[1]) : std::string_view());
}
