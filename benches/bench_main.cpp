#include <iostream>

void run_availability_benchmark();
void run_booking_benchmark();

int main() {
  std::cout << "slotkeeper benchmarks\n";
  run_availability_benchmark();
  run_booking_benchmark();
  return 0;
}
