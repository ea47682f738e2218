#include <iostream>
#include <string>
#include <vector>

// Records
#include "records/Account.hpp" // Record with activity flag
#include "records/Tag.hpp"     // Record without activity flag

#include <rowstore/rowstore.hpp>

using namespace RowStore;

// =============================================================================
// Helper Macros for Demo Output
// =============================================================================

#define DEMO_SECTION(name) std::cout << "\n=== " << name << " ===\n"
#define DEMO_CASE(name) std::cout << "\n--- " << name << " ---\n"
#define DEMO_PASS(msg) std::cout << "[PASS] " << msg << "\n"
#define DEMO_FAIL(msg) std::cout << "[FAIL] " << msg << "\n"
#define CHECK_STATUS(ec, expected, context)                                                        \
    if (ec == (expected)) {                                                                        \
        DEMO_PASS(context << ": " << ec.message());                                                \
    } else {                                                                                       \
        DEMO_FAIL(context << ": " << ec.message());                                                \
    }

static void printAccount(const Account& a) {
    std::cout << "  Account(number=" << a.number << ", open=" << (a.open ? "true" : "false")
              << ", name=" << a.name << ", balance=" << a.balance << ")\n";
}

// =============================================================================
// Account Store (activity-guarded)
// =============================================================================

void demoAccounts() {
    DEMO_SECTION("Account Store");
    std::error_code ec;
    RecordStore<Account> accounts;

    // =========================================================================
    // 1. Add
    // =========================================================================
    DEMO_CASE("Add Accounts");

    accounts.add(Account(1, true, "alice", 100), ec);
    CHECK_STATUS(ec, StoreErrc::NoError, "Add alice");

    accounts.add(Account(1, true, "alice-dup"), ec);
    CHECK_STATUS(ec, StoreErrc::RecordExists, "Add duplicate id=1");

    accounts.add(Account(2, false, "bob", 50), ec);
    CHECK_STATUS(ec, StoreErrc::NoError, "Add bob (closed)");

    accounts.add(Account(3, true, "carol", 75), ec);
    CHECK_STATUS(ec, StoreErrc::NoError, "Add carol");

    std::cout << "Count: " << accounts.count() << " (expected: 3)\n";

    // =========================================================================
    // 2. Navigation
    // =========================================================================
    DEMO_CASE("Navigate (circular)");

    Account cur = accounts.firstRecord();
    for (size_t i = 0; i < accounts.count() + 1; ++i) {
        printAccount(cur);
        cur = accounts.nextRecord(cur.id());
    }
    std::cout << "previous of first:\n";
    printAccount(accounts.previousRecord(accounts.firstRecord().id()));

    // =========================================================================
    // 3. Update Rules
    // =========================================================================
    DEMO_CASE("Update closed account");

    accounts.update(2, Account(2, false, "bobby", 50), false, ec);
    CHECK_STATUS(ec, StoreErrc::ReadOnly, "Rename closed account");

    accounts.update(2, Account(2, true, "bob", 50), false, ec);
    CHECK_STATUS(ec, StoreErrc::NoError, "Reopen account");

    Account bob = accounts.find(2, ec);
    Account renamed = bob;
    renamed.name = "bobby";
    accounts.update(bob, renamed, true, ec);
    CHECK_STATUS(ec, StoreErrc::NoError, "Rename open account");
    printAccount(accounts.find(2, ec));

    // =========================================================================
    // 4. Remove
    // =========================================================================
    DEMO_CASE("Remove");

    accounts.remove(1, ec);
    CHECK_STATUS(ec, StoreErrc::NoError, "Remove id=1");
    accounts.remove(1, ec);
    CHECK_STATUS(ec, StoreErrc::NoDelete, "Remove id=1 again");

    Account missing = accounts.find(1, ec);
    CHECK_STATUS(ec, StoreErrc::RecordNotFound, "Find id=1");
    printAccount(missing);

    std::cout << "\nFinal count: " << accounts.count() << "\n";
}

// =============================================================================
// Tag Store (string ids, no activity flag)
// =============================================================================

void demoTags() {
    DEMO_SECTION("Tag Store");
    std::error_code ec;
    RecordStore<Tag> tags(Tag("", ""));

    std::vector<Tag> initial{Tag("urgent", "red"), Tag("later", "grey"), Tag("home", "green")};
    if (!tags.assign(initial, ec)) {
        std::cerr << "assign: " << ec.message() << "\n";
        return;
    }

    DEMO_CASE("Snapshot");
    for (const auto& t : tags.findAll())
        std::cout << "  " << t.key << " (" << t.color << ")\n";

    DEMO_CASE("Update");
    tags.update(std::string("later"), Tag("someday", "grey"), true, ec);
    CHECK_STATUS(ec, StoreErrc::NoError, "Rename later -> someday");
    tags.update(std::string("home"), Tag("urgent", "green"), true, ec);
    CHECK_STATUS(ec, StoreErrc::RecordExists, "Rename home -> urgent");

    std::cout << "next after 'home': " << tags.nextRecord("home").key << "\n";
    std::cout << "next after unknown: " << tags.nextRecord("nope").key << "\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "========================================\n";
    std::cout << "    RowStore " << VERSION_STRING << " Demo\n";
    std::cout << "========================================\n";

    demoAccounts();
    demoTags();

    std::cout << "\n========================================\n";
    std::cout << "    Demo Completed\n";
    std::cout << "========================================\n";

    return 0;
}
