#include <iostream>

void run_availability_benchmark();
void run_codec_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "slotwatch Benchmarks\n";
  run_availability_benchmark();
  run_codec_benchmark();
  run_config_benchmark();
  return 0;
}
