#pragma once

#include <cstdio>
#include <string>

// Whole percentage of value/target, truncated toward zero.
// Returns 0 when target <= 0.
int progress_percent(long long value, long long target);

// True when the two percentages fall in different 10% buckets, i.e. the
// bar needs a redraw.
bool progress_bucket_changed(int old_percent, int new_percent);

// "[#####-----]  50%" : segment i is filled when i*10 < percent.
std::string progress_bar(int percent);

// Redraws the bar in place on `out` when moving from `previous` to
// `current` crosses a bucket boundary. No-op for a null stream or a
// non-positive target.
void update_progress(FILE* out, long long current, long long previous, long long target);
