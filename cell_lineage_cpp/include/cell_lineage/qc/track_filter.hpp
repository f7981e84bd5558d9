#pragma once

#include "cell_lineage/core/types.hpp"

#include <string>

namespace cell_lineage::qc {

struct QcThresholds {
  int max_splits_allowed = 3;
  int min_track_duration_frames = 20;
};

enum class QcVerdict {
  Accepted,
  TooManySplits,
  TooShort,
};

struct QcDecision {
  QcVerdict verdict = QcVerdict::Accepted;
  bool accepted = true;
  std::string reason; // empty when accepted
};

std::string qc_verdict_to_string(QcVerdict verdict);

// Split count is checked first, so a track that fails both rules reports
// TooManySplits.
QcDecision evaluate_track_qc(const TrackSummary &summary,
                             const QcThresholds &thresholds);

} // namespace cell_lineage::qc
