#include <core/model/transfer_event.h>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace shuttle::core;

namespace {

// Converts to an Error only by throwing, which leaves a variant being emplaced valueless
struct FailingError {
    operator event::Error() const { throw std::runtime_error("out of memory"); }
};

} // namespace

TEST(TransferEventTest, NamesEveryAlternative) {
    EXPECT_EQ(TransferEventName(event::Connect{}), "Connect");
    EXPECT_EQ(TransferEventName(event::TransferHeader{3}), "TransferHeader");
    EXPECT_EQ(TransferEventName(event::Progress{10}), "Progress");
    EXPECT_EQ(TransferEventName(event::Success{}), "Success");
    EXPECT_EQ(TransferEventName(event::Error{"boom"}), "Error");
    EXPECT_EQ(TransferEventName(event::Finish{}), "Finish");
}

TEST(TransferEventTest, ValuelessEventHasUnknownName) {
    TransferEvent raised = event::Error{"first"};
    EXPECT_THROW(raised.emplace<event::Error>(FailingError{}), std::runtime_error);
    ASSERT_TRUE(raised.valueless_by_exception());
    EXPECT_EQ(TransferEventName(raised), "Unknown");
}
