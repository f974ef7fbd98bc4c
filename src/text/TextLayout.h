#pragma once

#include <QString>
#include <QStringList>
#include <functional>

namespace TextLayout {

// Returns the rendered width of a candidate line in pixels.
using MeasureFn = std::function<double(const QString& line)>;

// Greedy word wrap. Paragraphs are separated by one or more newlines; words
// are never split, so a single word wider than maxWidth becomes its own
// (overflowing) line. Blank paragraphs are skipped and produce no line.
QStringList wrap(const QString& text, double maxWidth, const MeasureFn& measure);

} // namespace TextLayout
