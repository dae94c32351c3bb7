#pragma once
#include <telescore/customer.hpp>
#include <telescore/feature_spec.hpp>

namespace telescore {

// Per-model inputs produced from one encoding pass
struct ModelInputs {
  FeatureVector churn;
  FeatureVector clv;
};

// Stateless encoder bound to one feature spec. Cheap to construct per call.
class FeatureEncoder {
public:
  explicit FeatureEncoder(const FeatureSpec& spec) noexcept : spec_(spec) {}

  // Encode into the full layout. Throws ValidationError.
  [[nodiscard]] FeatureVector encode(const CustomerRecord& record) const;

  // Encode once and project onto both model views. Throws ValidationError.
  [[nodiscard]] ModelInputs encode(const CustomerRecord& record, const FeatureView& churn_view,
                                   const FeatureView& clv_view) const;

  [[nodiscard]] const FeatureSpec& spec() const noexcept { return spec_; }

private:
  const FeatureSpec& spec_;
};

}  // namespace telescore
