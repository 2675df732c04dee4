#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <gtest/gtest.h>
#include "test_support.hpp"

using namespace Tether::Browser;
using namespace Tether::Testing;
namespace Core = Tether::Core;

class ProvisionalCommitTest : public ::testing::Test {
protected:
    std::shared_ptr<Target> find(const std::string& id) {
        for (const auto& t : browser->targets()) {
            if (t->target_id() == id)
                return t;
        }
        return nullptr;
    }

    boost::asio::io_context  ioc;
    FakeConnection           connection{ioc};
    PageFactoryProbe         probe;
    std::shared_ptr<Browser> browser = Browser::create(connection, {}, probe.factory());
};

TEST_F(ProvisionalCommitTest, PageMovesToNewTarget) {
    connection.create_target("old", "page");
    auto page = await_result(ioc, find("old")->page());

    connection.create_target("new", "page");
    connection.commit("old", "new");
    ioc.restart();
    ioc.run();

    auto fake = as_fake(page);
    EXPECT_EQ(fake->swaps, 1);
    EXPECT_EQ(fake->target(), find("new"));
    ASSERT_TRUE(fake->session());
    EXPECT_EQ(fake->session()->target_id(), "new");

    EXPECT_EQ(await_result(ioc, find("new")->page()), page);
    EXPECT_EQ(probe.created, 1);
}

TEST_F(ProvisionalCommitTest, ConcurrentCallersBeforeCommitSeeOnePage) {
    Gate gate(ioc);
    probe.gate = &gate;
    connection.create_target("old", "page");
    auto old_target = find("old");

    std::shared_ptr<Page> first;
    std::shared_ptr<Page> second;
    std::shared_ptr<Page> via_new;
    auto request = [](std::shared_ptr<Target> target,
                      std::shared_ptr<Page>&  out) -> boost::asio::awaitable<void> {
        out = co_await target->page();
    };
    boost::asio::co_spawn(ioc, request(old_target, first), boost::asio::detached);
    boost::asio::co_spawn(ioc, request(old_target, second), boost::asio::detached);
    ioc.poll();

    connection.create_target("new", "page");
    connection.commit("old", "new");
    boost::asio::co_spawn(ioc, request(find("new"), via_new), boost::asio::detached);
    ioc.poll();
    EXPECT_FALSE(first);

    gate.open();
    ioc.run();

    ASSERT_TRUE(first);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, via_new);
    EXPECT_EQ(probe.created, 1);
    EXPECT_EQ(as_fake(first)->swaps, 1);
    EXPECT_EQ(as_fake(first)->target(), find("new"));
}

TEST_F(ProvisionalCommitTest, CommitWithoutPageIsIgnored) {
    connection.create_target("old", "page");
    connection.create_target("new", "page");

    connection.commit("old", "new");
    ioc.run();

    EXPECT_EQ(find("new")->page_cell(), nullptr);
    auto old_page = await_result(ioc, find("old")->page());
    auto new_page = await_result(ioc, find("new")->page());
    EXPECT_NE(old_page, new_page);
    EXPECT_EQ(as_fake(old_page)->swaps, 0);
}

TEST_F(ProvisionalCommitTest, CommitFromUnknownTargetIsIgnored) {
    connection.create_target("new", "page");
    EXPECT_NO_THROW(connection.commit("vanished", "new"));
    EXPECT_EQ(find("new")->page_cell(), nullptr);
}

TEST_F(ProvisionalCommitTest, CommitToUnannouncedTargetIsInternalError) {
    connection.create_target("old", "page");
    await_result(ioc, find("old")->page());

    EXPECT_THROW(connection.commit("old", "never-announced"), Core::InternalError);
}

TEST_F(ProvisionalCommitTest, OldTargetTeardownKeepsPageOnNewTarget) {
    connection.create_target("old", "page");
    auto page = await_result(ioc, find("old")->page());
    connection.create_target("new", "page");
    connection.commit("old", "new");
    ioc.restart();
    ioc.run();

    bool new_closed = false;
    find("new")->on_closed().subscribe([&] { new_closed = true; });
    connection.destroy_target("old");

    EXPECT_FALSE(new_closed);
    EXPECT_EQ(await_result(ioc, browser->pages()), std::vector<std::shared_ptr<Page>>{page});
    EXPECT_EQ(await_result(ioc, find("new")->page()), page);
}

TEST_F(ProvisionalCommitTest, ChainedCommitsKeepIdentity) {
    connection.create_target("a", "page");
    auto page = await_result(ioc, find("a")->page());

    connection.create_target("b", "page");
    connection.commit("a", "b");
    connection.destroy_target("a");
    connection.create_target("c", "page");
    connection.commit("b", "c");
    connection.destroy_target("b");
    ioc.restart();
    ioc.run();

    EXPECT_EQ(await_result(ioc, find("c")->page()), page);
    EXPECT_EQ(as_fake(page)->swaps, 2);
    EXPECT_EQ(as_fake(page)->target(), find("c"));
    EXPECT_EQ(probe.created, 1);
}

TEST_F(ProvisionalCommitTest, FailedMaterializationSurfacesFromRunAndNewTarget) {
    probe.broken.insert("old");
    connection.create_target("old", "page");
    connection.create_target("new", "page");
    find("old")->ensure_page();

    connection.commit("old", "new");
    ioc.restart();
    EXPECT_THROW(ioc.run(), Core::ProtocolError);

    std::string via_old;
    std::string via_new;
    try {
        await_result(ioc, find("old")->page());
    } catch (const Core::ProtocolError& e) {
        via_old = e.what();
    }
    try {
        await_result(ioc, find("new")->page());
    } catch (const Core::ProtocolError& e) {
        via_new = e.what();
    }
    EXPECT_FALSE(via_new.empty());
    EXPECT_EQ(via_old, via_new);
    EXPECT_EQ(probe.created, 0);
}

TEST_F(ProvisionalCommitTest, SwapAfterBrowserReleaseLeavesPageAlone) {
    connection.create_target("old", "page");
    auto page = await_result(ioc, find("old")->page());
    connection.create_target("new", "page");

    connection.commit("old", "new");
    browser.reset();
    ioc.restart();
    ioc.run();

    EXPECT_EQ(as_fake(page)->swaps, 0);
    EXPECT_EQ(connection.listener_count(), 0u);
}
