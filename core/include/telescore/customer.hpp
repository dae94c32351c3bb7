#pragma once
#include <string>

namespace telescore {

// Usage for one billing period (day / evening / night / international)
struct CallUsage {
  double minutes = 0.0;
  int calls = 0;
  double charge = 0.0;
};

// Raw customer attributes, one per scoring request
struct CustomerRecord {
  int account_length = 0;
  std::string state;
  std::string area_code;
  bool international_plan = false;
  bool voicemail_plan = false;
  int voicemail_messages = 0;

  CallUsage day;
  CallUsage evening;
  CallUsage night;
  CallUsage international;

  int customer_service_calls = 0;
};

}  // namespace telescore
