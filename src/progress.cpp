#include "progress.hpp"

static constexpr int BAR_SEGMENTS = 10;

int progress_percent(long long value, long long target)
{
    if (target <= 0) return 0;
    return static_cast<int>(static_cast<double>(value) / static_cast<double>(target) * 100.0);
}

bool progress_bucket_changed(int old_percent, int new_percent)
{
    return old_percent / 10 != new_percent / 10;
}

std::string progress_bar(int percent)
{
    std::string bar = "[";
    for (int i = 0; i < BAR_SEGMENTS; ++i)
        bar += (i * 10 < percent) ? '#' : '-';
    bar += ']';

    char num[16];
    std::snprintf(num, sizeof(num), " %3d%%", percent);
    bar += num;
    return bar;
}

void update_progress(FILE* out, long long current, long long previous, long long target)
{
    if (!out || target <= 0) return;

    const int now  = progress_percent(current, target);
    const int prev = progress_percent(previous, target);
    if (!progress_bucket_changed(prev, now)) return;

    std::fprintf(out, "%s\r", progress_bar(now).c_str());
    std::fflush(out);
}
