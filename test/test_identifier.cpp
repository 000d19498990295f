#include "../src/identifier.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>

using namespace idmill;

namespace {

template <typename A, typename B, typename = void>
struct IsEqualityComparable : std::false_type {};

template <typename A, typename B>
struct IsEqualityComparable<A, B, std::void_t<decltype(std::declval<const A&>() == std::declval<const B&>())>>
    : std::true_type {};

} // namespace

TEST(IdentifierTest, AccountIdEquality)
{
    AccountId id1("123456789");
    AccountId id2("234567890");

    EXPECT_EQ(id1, id1);
    EXPECT_EQ(id1, AccountId("123456789"));
    EXPECT_NE(id1, id2);
}

TEST(IdentifierTest, AccountIdRender)
{
    AccountId id("SIM-02851908");
    EXPECT_EQ("SIM-02851908", id.value());

    std::ostringstream os;
    os << id;
    EXPECT_EQ("SIM-02851908", os.str());
}

TEST(IdentifierTest, ComponentIdsDiffer)
{
    ComponentId risk("RiskEngine");
    ComponentId data("DataEngine");

    EXPECT_NE(risk, data);
    EXPECT_NE(risk.hash(), data.hash());
    EXPECT_EQ("RiskEngine", risk.value());
}

TEST(IdentifierTest, SymbolKeepsTextUnchanged)
{
    EXPECT_EQ("ETH-PERP", Symbol("ETH-PERP").value());
    EXPECT_EQ("XRD/USD", Symbol("XRD/USD").value());
    EXPECT_EQ("eth-perp", Symbol("eth-perp").value()); // No case folding
    EXPECT_NE(Symbol("ETH-PERP"), Symbol("eth-perp"));
}

TEST(IdentifierTest, VenueEquality)
{
    Venue ftx("FTX");
    EXPECT_EQ(ftx, ftx);
    EXPECT_EQ(ftx, Venue("FTX"));
    EXPECT_NE(ftx, Venue("IDEALPRO"));
}

TEST(IdentifierTest, HashConsistentWithEquality)
{
    std::string text = "BINANCE";
    Venue a(text);
    Venue b(std::string("BIN") + "ANCE");

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.hash(), b.hash());
    EXPECT_EQ(std::hash<Venue>{}(a), a.hash());
    EXPECT_EQ(hashText("BINANCE"), a.hash());
}

TEST(IdentifierTest, NoValidationApplied)
{
    EXPECT_EQ("", AccountId("").value());
    EXPECT_EQ("  padded  ", AccountId("  padded  ").value());
    EXPECT_EQ("Zürich-Börse", Venue("Zürich-Börse").value());
    EXPECT_EQ("'quoted'", Symbol("'quoted'").value());
}

TEST(IdentifierTest, EmbeddedNulPreserved)
{
    std::string text("A\0B", 3);
    Symbol symbol(text);
    EXPECT_EQ(3u, symbol.value().size());
    EXPECT_NE(symbol, Symbol("A"));
}

TEST(IdentifierTest, Repr)
{
    EXPECT_EQ("AccountId('SIM-001')", AccountId("SIM-001").repr());
    EXPECT_EQ("ComponentId('RiskEngine')", ComponentId("RiskEngine").repr());
    EXPECT_EQ("Symbol('ETHUSDT')", Symbol("ETHUSDT").repr());
    EXPECT_EQ("Venue('SIM')", Venue("SIM").repr());
}

TEST(IdentifierTest, CloneIsIndependent)
{
    auto original = std::make_unique<Symbol>("AUD/USD");
    Symbol copy = *original;

    EXPECT_EQ(*original, copy);
    EXPECT_NE(original->value().data(), copy.value().data());

    original.reset();
    EXPECT_EQ("AUD/USD", copy.value());
}

TEST(IdentifierTest, CopyAssignment)
{
    Venue venue("SIM");
    Venue other("FTX");
    other = venue;

    EXPECT_EQ(venue, other);
    EXPECT_EQ("SIM", venue.value());
}

TEST(IdentifierTest, KindsAreNotComparable)
{
    EXPECT_TRUE((IsEqualityComparable<AccountId, AccountId>::value));
    EXPECT_FALSE((IsEqualityComparable<AccountId, Venue>::value));
    EXPECT_FALSE((IsEqualityComparable<Symbol, ComponentId>::value));
    EXPECT_FALSE((std::is_convertible_v<std::string, Venue>));
}

TEST(IdentifierTest, UnorderedContainers)
{
    std::unordered_set<Venue> venues;
    venues.insert(Venue("FTX"));
    venues.insert(Venue("FTX"));
    venues.insert(Venue("IDEALPRO"));
    EXPECT_EQ(2u, venues.size());

    std::unordered_map<AccountId, int> balances;
    balances[AccountId("SIM-001")] = 100;
    balances[AccountId("SIM-001")] += 50;
    EXPECT_EQ(150, balances.at(AccountId("SIM-001")));
}
