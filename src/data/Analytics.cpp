#include "planner/data/Analytics.hpp"

namespace planner {
namespace data {

QString ratingLabel(ScheduleRating rating)
{
    switch (rating) {
    case ScheduleRating::Poor:
        return QStringLiteral("poor");
    case ScheduleRating::Fair:
        return QStringLiteral("fair");
    case ScheduleRating::Good:
        return QStringLiteral("good");
    case ScheduleRating::Excellent:
        return QStringLiteral("excellent");
    }
    return QStringLiteral("poor");
}

} // namespace data
} // namespace planner
