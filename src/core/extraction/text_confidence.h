#pragma once

#include <QString>

namespace ild {

// Quality score in [0,1] for generated text whose producer reports no
// calibrated confidence (document transformers, remote vision models).
//
//   alnumRatio  = (letters, digits and code points >= U+0900) / length
//   lengthScore = 0.5 if mean word length < 2, 0.7 if > 15, else 1.0
//   confidence  = alnumRatio * lengthScore * min(1, words / 10)
//
// Empty or whitespace-only text scores 0.
double estimateTextConfidence(const QString& text);

} // namespace ild
