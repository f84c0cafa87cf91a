#include "core/progress_estimator.h"

#include <algorithm>

namespace evx::core {

ProgressView ProgressEstimator::add(const ProgressSample &sample) {
  ProgressView view;
  view.status = sample.status;
  view.completed = sample.completed;
  view.total = sample.total;

  if (sample.completed && sample.total && *sample.total > 0) {
    const double fraction = static_cast<double>(*sample.completed) /
                            static_cast<double>(*sample.total);
    view.fraction = std::clamp(fraction, 0.0, 1.0);
  }

  if (previous_ && previous_->completed && sample.completed) {
    const Seconds dt = sample.at - previous_->at;
    if (dt.count() > 0.0) {
      const double delta = static_cast<double>(*sample.completed) -
                           static_cast<double>(*previous_->completed);
      view.rate = delta / dt.count();
    }
  }

  // rate <= 0 (stalled or regressed counter) leaves remaining unknown.
  if (view.rate && *view.rate > 0.0 && sample.completed && sample.total &&
      *sample.total > 0) {
    const double left = *sample.total > *sample.completed
                            ? static_cast<double>(*sample.total - *sample.completed)
                            : 0.0;
    view.remaining = Seconds(left / *view.rate);
  }

  previous_ = sample;
  last_view_ = view;
  ++sample_count_;
  return view;
}

ProgressView ProgressEstimator::add_bytes(TimePoint at, std::uint64_t bytes,
                                          std::optional<std::uint64_t> total_bytes) {
  ProgressSample sample;
  sample.at = at;
  sample.completed = bytes;
  sample.total = total_bytes;
  sample.status = TaskStatus::Running;

  ProgressView view = add(sample);
  if (view.rate && *view.rate >= 0.0) {
    view.throughput = view.rate;
  }
  last_view_ = view;
  return view;
}

void ProgressEstimator::reset() {
  previous_.reset();
  last_view_.reset();
  sample_count_ = 0;
}

} // namespace evx::core
