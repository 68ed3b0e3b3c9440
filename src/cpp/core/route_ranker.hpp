#pragma once
#include <algorithm>
#include <functional>
#include <iterator>
#include <string>
#include <vector>

#include "app/spdlog_tmp.hpp"
#include "core/errors.hpp"
#include "core/route.hpp"
#include "core/search_query.hpp"

// Total order over feasible routes: criterion, then transfers, then first departure, then leg ids.
class RouteRanker
{
    std::function<bool(const Route&, const Route&)> comp;

   public:
    explicit RouteRanker(RankCriterion criterion = RankCriterion::Price) :
            comp(criterion == RankCriterion::Price ? price_comp : duration_comp)
    {
    }

    void switch_comp(RankCriterion criterion) { comp = criterion == RankCriterion::Price ? price_comp : duration_comp; }

    // Sorts and removes routes with the same ordered leg ids.
    void rank(std::vector<Route>& routes) const
    {
        std::sort(routes.begin(), routes.end(), comp);
        // Equal leg ids imply equal keys, so duplicates are adjacent after sorting.
        routes.erase(std::unique(routes.begin(), routes.end()), routes.end());
    }

    RoutePage page(std::vector<Route> routes, int limit, int offset) const
    {
        if (limit <= 0)
            throw InvalidQuery("Limit must be positive, got " + std::to_string(limit));
        if (offset < 0)
            throw InvalidQuery("Offset must be non-negative, got " + std::to_string(offset));

        rank(routes);

        RoutePage result;
        result.total_count = routes.size();
        size_t first = static_cast<size_t>(offset);
        if (first >= routes.size())
            return result;

        size_t last = std::min(routes.size(), first + static_cast<size_t>(limit));
        result.routes.assign(std::make_move_iterator(routes.begin() + first),
                             std::make_move_iterator(routes.begin() + last));
        logger_->debug("Page [{}, {}) of {} routes", first, last, result.total_count);
        return result;
    }

   private:
    static bool tie_break(const Route& t1, const Route& t2)
    {
        bool me1 = (t1.transferCount() < t2.transferCount());
        bool me2 = (t1.departure() < t2.departure());
        bool e1 = (t1.transferCount() == t2.transferCount());
        bool e2 = (t1.departure() == t2.departure());
        if (me1 || (e1 && me2))
            return true;
        if (!e1 || !e2)
            return false;
        auto ids1 = t1.legIds();
        auto ids2 = t2.legIds();
        return std::lexicographical_compare(ids1.begin(), ids1.end(), ids2.begin(), ids2.end());
    }

    static bool price_comp(const Route& t1, const Route& t2)
    {
        Money p1 = t1.totalPrice();
        Money p2 = t2.totalPrice();
        return (p1 < p2) || (p1 == p2 && tie_break(t1, t2));
    }

    static bool duration_comp(const Route& t1, const Route& t2)
    {
        Seconds d1 = t1.totalDuration();
        Seconds d2 = t2.totalDuration();
        return (d1 < d2) || (d1 == d2 && tie_break(t1, t2));
    }
};
