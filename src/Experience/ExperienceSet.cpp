//
// Created by moinshaikh on 3/2/26.
//

#include<algorithm>
#include<iterator>
#include<stdexcept>
#include<string>

#include"../../include/Experience/ExperienceSet.hpp"

#include<doctest/doctest.h>

namespace PolicyHub
{
    namespace
    {
        torch::Tensor stackRows(const std::vector<std::vector<float>> &rows, const char *column)
        {
            auto width = static_cast<int64_t>(rows.front().size());
            std::vector<float> flat;
            flat.reserve(rows.size() * rows.front().size());
            for (const auto &row : rows)
            {
                if (static_cast<int64_t>(row.size()) != width)
                {
                    throw std::invalid_argument(std::string("Inconsistent row width in column '") + column + "'");
                }
                flat.insert(flat.end(), row.begin(), row.end());
            }
            return torch::from_blob(flat.data(), {static_cast<int64_t>(rows.size()), width}).clone();
        }
    }

    ExperienceSet::ExperienceSet(std::vector<std::vector<float>> states,
                                 std::vector<std::vector<float>> actions,
                                 std::vector<float> rewards,
                                 std::vector<std::vector<float>> nextStates) :
        states(std::move(states)),
        actions(std::move(actions)),
        rewards(std::move(rewards)),
        nextStates(std::move(nextStates))
    {
        validate();
    }

    void ExperienceSet::validate() const
    {
        if (states.size() != rewards.size() || actions.size() != rewards.size() || nextStates.size() != rewards.size())
        {
            throw std::invalid_argument("Experience columns must have the same length (states: " +
                                        std::to_string(states.size()) + ", actions: " +
                                        std::to_string(actions.size()) + ", rewards: " +
                                        std::to_string(rewards.size()) + ", next states: " +
                                        std::to_string(nextStates.size()) + ")");
        }
    }

    void ExperienceSet::add(std::vector<float> state, std::vector<float> action, float reward, std::vector<float> nextState)
    {
        states.push_back(std::move(state));
        actions.push_back(std::move(action));
        rewards.push_back(reward);
        nextStates.push_back(std::move(nextState));
    }

    void ExperienceSet::extend(const ExperienceSet &other)
    {
        states.insert(states.end(), other.states.begin(), other.states.end());
        actions.insert(actions.end(), other.actions.begin(), other.actions.end());
        rewards.insert(rewards.end(), other.rewards.begin(), other.rewards.end());
        nextStates.insert(nextStates.end(), other.nextStates.begin(), other.nextStates.end());
    }

    void ExperienceSet::extend(ExperienceSet &&other)
    {
        if (empty())
        {
            *this = std::move(other);
            other.clear();
            return;
        }
        states.insert(states.end(), std::make_move_iterator(other.states.begin()), std::make_move_iterator(other.states.end()));
        actions.insert(actions.end(), std::make_move_iterator(other.actions.begin()), std::make_move_iterator(other.actions.end()));
        rewards.insert(rewards.end(), other.rewards.begin(), other.rewards.end());
        nextStates.insert(nextStates.end(), std::make_move_iterator(other.nextStates.begin()), std::make_move_iterator(other.nextStates.end()));
        other.clear();
    }

    ExperienceSet ExperienceSet::slice(std::size_t begin, std::size_t end) const
    {
        end = std::min(end, size());
        begin = std::min(begin, end);
        return ExperienceSet({states.begin() + begin, states.begin() + end},
                             {actions.begin() + begin, actions.begin() + end},
                             {rewards.begin() + begin, rewards.begin() + end},
                             {nextStates.begin() + begin, nextStates.begin() + end});
    }

    void ExperienceSet::clear()
    {
        states.clear();
        actions.clear();
        rewards.clear();
        nextStates.clear();
    }

    ExperienceTensors ExperienceSet::toTensors() const
    {
        if (empty())
        {
            throw std::invalid_argument("Cannot build tensors from an empty experience set");
        }
        ExperienceTensors tensors;
        tensors.states = stackRows(states, "states");
        tensors.actions = stackRows(actions, "actions");
        tensors.nextStates = stackRows(nextStates, "next states");
        std::vector<float> rewardCopy(rewards);
        tensors.rewards = torch::from_blob(rewardCopy.data(), {static_cast<int64_t>(rewardCopy.size()), 1}).clone();
        return tensors;
    }

    TEST_CASE("ExperienceSet")
    {
        ExperienceSet first;
        first.add({0, 0}, {1}, 0.5, {0, 1});
        first.add({0, 1}, {0}, -1, {1, 1});

        SUBCASE("size() counts transitions")
        {
            CHECK(first.size() == 2);
            CHECK(ExperienceSet().size() == 0);
        }

        SUBCASE("extend() appends in order")
        {
            ExperienceSet second({{1, 1}}, {{2}}, {3}, {{1, 0}});
            first.extend(second);

            REQUIRE(first.size() == 3);
            CHECK(second.size() == 1);
            CHECK(first.get_rewards()[0] == doctest::Approx(0.5));
            CHECK(first.get_rewards()[1] == doctest::Approx(-1));
            CHECK(first.get_rewards()[2] == doctest::Approx(3));
            CHECK(first.get_actions()[2][0] == doctest::Approx(2));
        }

        SUBCASE("Moving extend() empties the source")
        {
            ExperienceSet second({{1, 1}}, {{2}}, {3}, {{1, 0}});
            first.extend(std::move(second));
            CHECK(first.size() == 3);

            ExperienceSet target;
            target.extend(std::move(first));
            CHECK(target.size() == 3);
            CHECK(target.get_rewards()[2] == doctest::Approx(3));
        }

        SUBCASE("Mismatched columns throw")
        {
            CHECK_THROWS_AS(ExperienceSet({{1}}, {{1}, {2}}, {1}, {{1}}), std::invalid_argument);
        }

        SUBCASE("toTensors() produces batch-major tensors")
        {
            auto tensors = first.toTensors();
            CHECK(tensors.states.size(0) == 2);
            CHECK(tensors.states.size(1) == 2);
            CHECK(tensors.actions.size(1) == 1);
            CHECK(tensors.rewards.size(0) == 2);
            CHECK(tensors.rewards.size(1) == 1);
            CHECK(tensors.rewards[1][0].item().toFloat() == doctest::Approx(-1));
            CHECK(tensors.nextStates[0][1].item().toFloat() == doctest::Approx(1));
        }

        SUBCASE("toTensors() rejects ragged rows")
        {
            first.add({1, 2, 3}, {1}, 0, {0, 0});
            CHECK_THROWS_AS(first.toTensors(), std::invalid_argument);
        }

        SUBCASE("slice() copies a sub-range")
        {
            auto tail = first.slice(1, 10);
            REQUIRE(tail.size() == 1);
            CHECK(tail.get_rewards()[0] == doctest::Approx(-1));
        }
    }
}
