#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"

#include "tui.h"

int main(int argc, char **argv) {
  // The sink stays stopped, so logging from code under test is discarded unless a test
  // runs it.
  provision::tui::init();
  return doctest::Context{ argc, argv }.run();
}
