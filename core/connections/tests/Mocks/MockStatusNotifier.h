// =============================================================================
// connections/tests/Mocks/MockStatusNotifier.h
// =============================================================================

#ifndef OTLINK_TESTS_MOCK_STATUS_NOTIFIER_H
#define OTLINK_TESTS_MOCK_STATUS_NOTIFIER_H

#include "Scheduler/StatusChangeNotifier.h"

#include <gmock/gmock.h>

namespace OtLink {
namespace Testing {

class MockStatusNotifier : public Scheduler::IStatusChangeNotifier {
public:
  MOCK_METHOD(void, OnStatusChange, (const Structs::StatusTransitionEvent &event),
              (override));
};

} // namespace Testing
} // namespace OtLink

#endif // OTLINK_TESTS_MOCK_STATUS_NOTIFIER_H
