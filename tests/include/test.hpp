#pragma once

// =============================================================================
// celio - Test Framework (Master Include)
// =============================================================================
//
// Single include for all test utilities.
//
// Components:
//   - core.hpp    : Test registration, runner, assertions, reporters
//   - fixture.hpp : Scratch stores on both backends, warning capture
//   - oracle.hpp  : Eigen reference for sparse partial reads
//
// Usage:
//   #include "test.hpp"
//
//   CELIO_TEST_BEGIN
//
//   CELIO_TEST_UNIT(dense_round_trip) {
//       for (auto kind : celio::test::all_backends()) {
//           celio::test::Store store(kind);
//           celio::spec::write_elem(*store.root(), "x", celio::DenseArray::from<int>({1, 2}));
//           ...
//       }
//   }
//
//   CELIO_TEST_END
//   CELIO_TEST_MAIN()
//
// =============================================================================

// Core testing framework
#include "core.hpp"

// Scratch stores and warning capture
#include "fixture.hpp"

// Eigen reference implementation
#include "oracle.hpp"
