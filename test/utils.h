#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include <snipbox/results.h>

// Writes the source as a unit without screening it
SourceUnit MaterializeOrDie(const std::string& source);

// Sets the modification time of the unit to exactly `now - age`
void SetUnitAge(const SourceUnit&, std::chrono::system_clock::time_point now,
                std::chrono::system_clock::duration age);

size_t CountUnits();

// For suites that start real sandboxes: cjail needs root
class SandboxTest : public ::testing::Test {
 protected:
  void SetUp() override;
};

#endif // TEST_UTILS_H_
