/**
 * @file deletion_ledger_tests.cpp
 * @brief Unit tests for DeletionLedger
 */
#include <gtest/gtest.h>
#include "reqsync/changeset/deletion_ledger.hpp"
#include "support/reqsync_fixtures.hpp"

using namespace reqsync;
using namespace reqsync_test;

namespace
{

/// Record a deletion of `item` in `action` the way folder reconciliation does.
void propose(DeletionLedger& ledger, const WorkItem& item, const ChangeActionPtr& action)
{
    action->deletions[slot_name(item.kind)].push_back(Reference::concrete(item.uuid));
    ledger.propose(item, action);
}

} // namespace

TEST(DeletionLedgerTests, Propose_NullActionThrows)
{
    AlignedFixture fx;
    DeletionLedger ledger;
    EXPECT_THROW(ledger.propose(*fx.req_101, nullptr), std::invalid_argument);
    EXPECT_FALSE(ledger.retract(*fx.req_101));
}

TEST(DeletionLedgerTests, Retract_RemovesReferenceAndEmptySlot)
{
    AlignedFixture fx;
    DeletionLedger ledger;
    auto action = std::make_shared<ChangeAction>(Reference::concrete(fx.folder_100->uuid));
    propose(ledger, *fx.req_101, action);

    EXPECT_TRUE(ledger.retract(*fx.req_101));
    EXPECT_FALSE(ledger.retract(*fx.req_101));
    EXPECT_TRUE(action->deletions.empty());
    EXPECT_TRUE(action->is_void());
}

TEST(DeletionLedgerTests, Retract_KeepsOtherProposalsOfSameAction)
{
    AlignedFixture fx;
    DeletionLedger ledger;
    auto action = std::make_shared<ChangeAction>(Reference::concrete(fx.folder_100->uuid));
    propose(ledger, *fx.req_101, action);
    propose(ledger, *fx.req_102, action);

    ledger.retract(*fx.req_101);
    ASSERT_EQ(action->deletions.count("requirements"), 1u);
    EXPECT_EQ(action->deletions.at("requirements"),
              (std::vector<Reference>{Reference::concrete("req-102-uuid")}));
    EXPECT_TRUE(ledger.retract(*fx.req_102));
    EXPECT_TRUE(action->deletions.empty());
}

TEST(DeletionLedgerTests, Retract_UsesSlotOfEntityKind)
{
    AlignedFixture fx;
    DeletionLedger ledger;
    auto action = std::make_shared<ChangeAction>(Reference::concrete(fx.module->uuid));
    propose(ledger, *fx.folder_200, action);
    propose(ledger, *fx.req_300, action);

    ledger.retract(*fx.folder_200);
    EXPECT_EQ(action->deletions.count("folders"), 0u);
    EXPECT_EQ(action->deletions.count("requirements"), 1u);
}

TEST(DeletionLedgerTests, Retract_NeverProposedIsNoOp)
{
    AlignedFixture fx;
    DeletionLedger ledger;
    EXPECT_FALSE(ledger.retract(*fx.req_201));
    EXPECT_FALSE(ledger.retract(*fx.req_201));
}

TEST(DeletionLedgerTests, Relocated_RemembersIdentifiers)
{
    DeletionLedger ledger;
    EXPECT_FALSE(ledger.is_relocated("101"));
    ledger.mark_relocated("101");
    EXPECT_TRUE(ledger.is_relocated("101"));
    EXPECT_FALSE(ledger.is_relocated("102"));
}
