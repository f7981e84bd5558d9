#include "cell_lineage/qc/track_filter.hpp"

namespace cell_lineage::qc {

std::string qc_verdict_to_string(QcVerdict verdict) {
  switch (verdict) {
  case QcVerdict::Accepted:
    return "accepted";
  case QcVerdict::TooManySplits:
    return "too_many_splits";
  case QcVerdict::TooShort:
    return "too_short";
  default:
    return "unknown";
  }
}

QcDecision evaluate_track_qc(const TrackSummary &summary,
                             const QcThresholds &thresholds) {
  QcDecision out;
  if (summary.n_splits > thresholds.max_splits_allowed) {
    out.verdict = QcVerdict::TooManySplits;
    out.accepted = false;
    out.reason = std::to_string(summary.n_splits) + " splits > max " +
                 std::to_string(thresholds.max_splits_allowed);
    return out;
  }

  const int duration = summary.duration();
  if (duration < thresholds.min_track_duration_frames) {
    out.verdict = QcVerdict::TooShort;
    out.accepted = false;
    out.reason = "duration " + std::to_string(duration) + " < min " +
                 std::to_string(thresholds.min_track_duration_frames) +
                 " frames";
    return out;
  }

  out.verdict = QcVerdict::Accepted;
  out.accepted = true;
  return out;
}

} // namespace cell_lineage::qc
