#include "communication/dashboard_service.hpp"

#include <gtest/gtest.h>

namespace gtest
{

    TEST(DashboardFilter, EmptyQueryFiltersNothing)
    {
        ErrorFilter filter = DashboardService::filterFromParams({});
        EXPECT_FALSE(filter.severity.has_value());
        EXPECT_FALSE(filter.category.has_value());
        EXPECT_FALSE(filter.component.has_value());
        EXPECT_FALSE(filter.hours.has_value());
        EXPECT_EQ(filter.limit, 100);
    }

    TEST(DashboardFilter, ParsesEveryField)
    {
        httplib::Params params = {{"severity", "high"},
                                  {"category", "CAPTURE"},
                                  {"component", "Scheduler"},
                                  {"hours", "1.5"},
                                  {"limit", "20"}};

        ErrorFilter filter = DashboardService::filterFromParams(params);
        EXPECT_EQ(filter.severity, ErrorSeverity::HIGH);
        EXPECT_EQ(filter.category, ErrorCategory::CAPTURE);
        EXPECT_EQ(filter.component, string("Scheduler"));
        EXPECT_DOUBLE_EQ(*filter.hours, 1.5);
        EXPECT_EQ(filter.limit, 20);
    }

    TEST(DashboardFilter, RejectsBadValues)
    {
        EXPECT_THROW(DashboardService::filterFromParams({{"severity", "urgent"}}), invalid_argument);
        EXPECT_THROW(DashboardService::filterFromParams({{"category", "AUDIO"}}), invalid_argument);
        EXPECT_THROW(DashboardService::filterFromParams({{"limit", "0"}}), invalid_argument);
        EXPECT_THROW(DashboardService::filterFromParams({{"hours", "soon"}}), invalid_argument);
    }

} // namespace gtest
