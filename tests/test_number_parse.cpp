#include "eegmon/utils.hpp"

#include "test_support.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

static bool nearly(double a, double b, double eps = 1e-12) {
  return std::fabs(a - b) <= eps;
}

template <typename F>
static bool throws(F&& f) {
  try {
    f();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

int main() {
  using namespace eegmon;

  // to_int()
  assert(to_int("42") == 42);
  assert(to_int("  -10  ") == -10);
  assert(throws([] { (void)to_int("12abc"); }));
  assert(throws([] { (void)to_int(""); }));
  assert(throws([] { (void)to_int("99999999999"); }));

  // to_double()
  assert(nearly(to_double("1.25"), 1.25));
  assert(nearly(to_double("  -3.5  "), -3.5));
  assert(nearly(to_double("1e3"), 1000.0));
  // Decimal comma convenience: common in some locales.
  assert(nearly(to_double("0,5"), 0.5));
  assert(throws([] { (void)to_double("1.23abc"); }));
  assert(throws([] { (void)to_double("1,2,3"); }));
  assert(throws([] { (void)to_double("1.5,2"); }));
  assert(throws([] { (void)to_double("   "); }));

  {
    std::string msg;
    try {
      (void)to_double("fast");
    } catch (const std::exception& e) {
      msg = e.what();
    }
    assert(msg.find("'fast'") != std::string::npos);
  }

  // to_bool()
  assert(to_bool("1") && to_bool(" TRUE ") && to_bool("yes") && to_bool("On"));
  assert(!to_bool("0") && !to_bool("false") && !to_bool("NO") && !to_bool("off"));
  assert(throws([] { (void)to_bool("maybe"); }));

  // String helpers.
  assert(trim("\t a b \r\n") == "a b");
  assert(trim("   ").empty());
  assert(strip_utf8_bom("\xEF\xBB\xBFkey = 1") == "key = 1");
  assert(strip_utf8_bom("key") == "key");
  assert(to_lower("ttyUSB0") == "ttyusb0");
  assert(starts_with("/dev/ttyUSB0", "/dev/") && !starts_with("/de", "/dev/"));
  assert(ends_with("rec.dat", ".dat") && !ends_with("dat", ".dat"));

  {
    const std::vector<std::string> parts = split("a,,b,", ',');
    assert(parts.size() == 4);
    assert(parts[0] == "a" && parts[1].empty() && parts[2] == "b" && parts[3].empty());
    assert(split("", ',').empty());
  }

  {
    const uint8_t bytes[] = {0x0a, 0xff, 0x10};
    assert(hex_bytes(bytes, 3) == "0a ff 10");
    assert(hex_bytes(bytes, 0).empty());
    assert(hex_bytes(nullptr, 3).empty());
  }

  assert(join_path("", "x.dat") == "x.dat");
  assert(join_path("recordings", "x.dat") == "recordings/x.dat");

  {
    const std::string stamp = now_string_compact();
    assert(stamp.size() == 15 && stamp[8] == '-');
    const std::string iso = now_string_local();
    assert(iso.size() == 25 && iso[10] == 'T');
  }

  {
    const double a = monotonic_seconds();
    const double b = monotonic_seconds();
    assert(b >= a);
  }

  std::cout << "test_number_parse OK\n";
  return 0;
}
