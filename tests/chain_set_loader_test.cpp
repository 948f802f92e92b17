// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include <string>

#include "ribopnet/errors.hpp"
#include "ribopnet/mrna/chain_compiler.hpp"
#include "ribopnet/mrna/chain_set_loader.hpp"
#include "ribopnet/mrna/resource_extension.hpp"

#ifndef RIBOPNET_DATA_DIR
#define RIBOPNET_DATA_DIR "data"
#endif

using namespace ribopnet;
using namespace ribopnet::mrna;

namespace
{
    json base_doc()
    {
        return json::parse(R"({
            "chains": [
                {"name": "chainA", "sequence": "MALWM", "polipeptide_name": "preinsulin"}
            ],
            "simulation_parameters": {
                "initial_chains_marking": 2,
                "max_protein_output_goal": 2,
                "excess_aminoacids_factor": 1,
                "ribosome_parameters": {"initial_ribosomes": 3}
            }
        })");
    }
}

TEST(ChainSetLoaderTest, ParsesFullDescription)
{
    const ChainSet set = chain_set_from_json(base_doc());

    ASSERT_EQ(set.chains.size(), 1u);
    EXPECT_EQ(set.chains[0].name, "chainA");
    EXPECT_EQ(set.chains[0].sequence, "MALWM");
    EXPECT_EQ(set.chains[0].product_name, "preinsulin");
    EXPECT_EQ(set.parameters.initial_marking_per_chain, 2);
    EXPECT_EQ(set.parameters.target_output, 2);
    ASSERT_TRUE(set.parameters.excess_factor.has_value());
    EXPECT_DOUBLE_EQ(*set.parameters.excess_factor, 1.0);
    ASSERT_TRUE(set.parameters.resource_parameters.has_value());
    EXPECT_EQ(set.parameters.resource_parameters->initial_units, 3);
}

TEST(ChainSetLoaderTest, OptionalSectionsMayBeAbsent)
{
    json doc = base_doc();
    doc["simulation_parameters"].erase("excess_aminoacids_factor");
    doc["simulation_parameters"].erase("ribosome_parameters");

    const ChainSet set = chain_set_from_json(doc);
    EXPECT_FALSE(set.parameters.excess_factor.has_value());
    EXPECT_FALSE(set.parameters.resource_parameters.has_value());
}

TEST(ChainSetLoaderTest, AcceptsProductNameAlias)
{
    json doc = base_doc();
    doc["chains"][0].erase("polipeptide_name");
    doc["chains"][0]["product_name"] = "insulin";
    EXPECT_EQ(chain_set_from_json(doc).chains[0].product_name, "insulin");
}

TEST(ChainSetLoaderTest, NegativeValuesSurviveParsingAndFailAtCompile)
{
    json doc = base_doc();
    doc["simulation_parameters"]["initial_chains_marking"] = -1;

    const ChainSet set = chain_set_from_json(doc);
    EXPECT_EQ(set.parameters.initial_marking_per_chain, -1);
    EXPECT_THROW(compile(set.chains, set.parameters), InvalidParametersError);
}

TEST(ChainSetLoaderTest, ErrorsAreClassifiedBySection)
{
    {
        json doc = base_doc();
        doc["chains"][0].erase("sequence");
        EXPECT_THROW(chain_set_from_json(doc), InvalidChainError);
    }
    {
        json doc = base_doc();
        doc["chains"][0]["name"] = 7;
        EXPECT_THROW(chain_set_from_json(doc), InvalidChainError);
    }
    {
        json doc = base_doc();
        doc.erase("chains");
        EXPECT_THROW(chain_set_from_json(doc), InvalidChainError);
    }
    {
        json doc = base_doc();
        doc["simulation_parameters"].erase("initial_chains_marking");
        EXPECT_THROW(chain_set_from_json(doc), InvalidParametersError);
    }
    {
        json doc = base_doc();
        doc["simulation_parameters"]["max_protein_output_goal"] = "many";
        EXPECT_THROW(chain_set_from_json(doc), InvalidParametersError);
    }
    {
        json doc = base_doc();
        doc["simulation_parameters"]["ribosome_parameters"] = json::object();
        EXPECT_THROW(chain_set_from_json(doc), InvalidResourceError);
    }
    EXPECT_THROW(chain_set_from_json(json::array()), ConfigError);
}

TEST(ChainSetLoaderTest, WritesWhatItReads)
{
    const json doc = base_doc();
    EXPECT_EQ(to_json(chain_set_from_json(doc)), doc);
}

TEST(ChainSetLoaderTest, LoadsBundledPreinsulinExample)
{
    const ChainSet set = load_chain_set(std::string(RIBOPNET_DATA_DIR) + "/preinsulin_ribosomes.json");
    ASSERT_EQ(set.chains.size(), 1u);
    EXPECT_EQ(set.chains[0].length(), 110u);

    const pnet::Network net = extend(compile(set.chains, set.parameters), set.chains, set.parameters.resource_parameters);
    EXPECT_EQ(net.transitions.size(), 110u);
    EXPECT_EQ(net.places.size(), 112u); // 110 positions, product, ribosome pool
    EXPECT_EQ(net.place("p_free_ribosomes").initial_marking, 2);
    EXPECT_EQ(net.transition("t_chainA_t110").produce.at("p_free_ribosomes"), 1);
}

TEST(ChainSetLoaderTest, MissingFileRaisesConfigError)
{
    EXPECT_THROW(load_chain_set(std::string(RIBOPNET_DATA_DIR) + "/nope.json"), ConfigError);
}
