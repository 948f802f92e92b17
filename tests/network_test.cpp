// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include <cstdio>
#include <string>

#include "ribopnet/errors.hpp"
#include "ribopnet/mrna/chain_compiler.hpp"
#include "ribopnet/mrna/resource_extension.hpp"
#include "ribopnet/pnet/network.hpp"
#include "ribopnet/pnet/network_json.hpp"

using namespace ribopnet;
using namespace ribopnet::pnet;

namespace
{
    Network ribosome_network()
    {
        const std::vector<mrna::Chain> chains{{"chainA", "MALWM", "preinsulin"}, {"chainB", "FVNQ", "preinsulin"}};
        mrna::SimulationParameters params;
        params.initial_marking_per_chain = 2;
        params.target_output = 2;
        return mrna::extend(mrna::compile(chains, params), chains, mrna::ResourceParameters{3});
    }
}

TEST(NetworkTest, AddPlaceRejectsDuplicates)
{
    Network net;
    EXPECT_TRUE(net.add_place("p", 1));
    EXPECT_FALSE(net.add_place("p", 5));
    EXPECT_EQ(net.place("p").initial_marking, 1);
}

TEST(NetworkTest, AddArcMergesWeights)
{
    ArcMap arcs{{"a", 1}};
    add_arc(arcs, "a", 2);
    add_arc(arcs, "b", 1);
    EXPECT_EQ(arcs, (ArcMap{{"a", 3}, {"b", 1}}));
}

TEST(NetworkTest, IntegrityReportsDanglingArcs)
{
    Network net;
    net.add_place("p0", 1);
    net.add_transition(Transition{"t", {{"p0", 1}}, {{"ghost", 1}}});

    const auto problems = check_integrity(net);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("ghost"), std::string::npos);
}

TEST(NetworkTest, IntegrityReportsBadWeightsAndMarkings)
{
    Network net;
    net.add_place("p0", -1);
    net.add_place("p1", 0);
    net.add_transition(Transition{"t", {{"p0", 0}}, {{"p1", 1}}});

    EXPECT_EQ(check_integrity(net).size(), 2u);
}

TEST(NetworkTest, IntegrityReportsKeyMismatch)
{
    Network net;
    net.places["p"] = Place{"q", 0};
    EXPECT_EQ(check_integrity(net).size(), 1u);
}

TEST(NetworkJsonTest, ProducesEngineLayout)
{
    const json doc = to_json(ribosome_network());

    ASSERT_TRUE(doc.contains("places"));
    ASSERT_TRUE(doc.contains("transitions"));
    EXPECT_EQ(doc["places"]["p_chainA_0"], 2);
    EXPECT_EQ(doc["places"]["p_free_ribosomes"], 3);
    EXPECT_EQ(doc["transitions"]["t_chainA_t1"]["consume"]["p_free_ribosomes"], 1);
    EXPECT_EQ(doc["transitions"]["t_chainB_t4"]["produce"]["p_preinsulin"], 1);
    EXPECT_TRUE(doc["transitions"]["t_chainA_t3"]["consume"].is_object());
}

TEST(NetworkJsonTest, ReadsBackEqualNetwork)
{
    const Network net = ribosome_network();
    const json doc = to_json(net);

    EXPECT_EQ(network_from_json(doc), net);
    EXPECT_EQ(to_json(network_from_json(doc)).dump(), doc.dump());
}

TEST(NetworkJsonTest, MissingArcMapsReadAsEmpty)
{
    const json doc = json::parse(R"({"places": {"a": 1, "b": 0}, "transitions": {"t": {"consume": {"a": 1}}}})");
    const Network net = network_from_json(doc);
    EXPECT_TRUE(net.transition("t").produce.empty());
    EXPECT_EQ(net.transition("t").consume.at("a"), 1);
}

TEST(NetworkJsonTest, MalformedDocumentsRaiseConfigError)
{
    EXPECT_THROW(network_from_json(json::array()), ConfigError);
    EXPECT_THROW(network_from_json(json::parse(R"({"places": {}})")), ConfigError);
    EXPECT_THROW(network_from_json(json::parse(R"({"places": {"a": "x"}, "transitions": {}})")), ConfigError);
    EXPECT_THROW(network_from_json(json::parse(R"({"places": {"a": 1}, "transitions": {"t": {"consume": [1]}}})")),
                 ConfigError);
}

TEST(NetworkJsonTest, SaveThenLoad)
{
    const Network net = ribosome_network();
    const std::string path = ::testing::TempDir() + "ribopnet_network_test.json";

    save_network(net, path);
    EXPECT_EQ(load_network(path), net);
    std::remove(path.c_str());
}

TEST(NetworkJsonTest, LoadMissingFileRaisesConfigError)
{
    EXPECT_THROW(load_network(::testing::TempDir() + "does_not_exist.json"), ConfigError);
}
