//
// Created by moinshaikh on 3/2/26.
//

#include"../../include/Experience/ExperienceMemory.hpp"

#include<doctest/doctest.h>

namespace PolicyHub
{
    ExperienceMemory::ExperienceMemory(std::size_t capacity) : capacity(capacity)
    {

    }

    void ExperienceMemory::put(const ExperienceSet &batch)
    {
        records.extend(batch);
        evict();
    }

    void ExperienceMemory::put(ExperienceSet &&batch)
    {
        records.extend(std::move(batch));
        evict();
    }

    ExperienceSet ExperienceMemory::latest(std::size_t count) const
    {
        if (count >= records.size())
        {
            return records;
        }
        return records.slice(records.size() - count, records.size());
    }

    void ExperienceMemory::clear()
    {
        records.clear();
    }

    void ExperienceMemory::evict()
    {
        if (capacity > 0 && records.size() > capacity)
        {
            records = records.slice(records.size() - capacity, records.size());
        }
    }

    static ExperienceSet makeBatch(int first, int count)
    {
        ExperienceSet batch;
        for (int i = first; i < first + count; ++i)
        {
            batch.add({static_cast<float>(i)}, {0}, static_cast<float>(i), {static_cast<float>(i + 1)});
        }
        return batch;
    }

    TEST_CASE("ExperienceMemory")
    {
        SUBCASE("Unbounded memory keeps everything")
        {
            ExperienceMemory memory;
            memory.put(makeBatch(0, 3));
            memory.put(makeBatch(3, 4));
            CHECK(memory.size() == 7);
            CHECK(memory.get().get_rewards().front() == doctest::Approx(0));
            CHECK(memory.get().get_rewards().back() == doctest::Approx(6));
        }

        SUBCASE("Bounded memory overwrites the oldest records")
        {
            ExperienceMemory memory(5);
            memory.put(makeBatch(0, 3));
            memory.put(makeBatch(3, 4));
            REQUIRE(memory.size() == 5);
            CHECK(memory.get().get_rewards().front() == doctest::Approx(2));
            CHECK(memory.get().get_rewards().back() == doctest::Approx(6));
        }

        SUBCASE("latest() returns the newest records")
        {
            ExperienceMemory memory;
            memory.put(makeBatch(0, 6));
            auto recent = memory.latest(2);
            REQUIRE(recent.size() == 2);
            CHECK(recent.get_rewards()[0] == doctest::Approx(4));
            CHECK(memory.latest(100).size() == 6);
        }

        SUBCASE("clear() empties the memory")
        {
            ExperienceMemory memory;
            memory.put(makeBatch(0, 2));
            memory.clear();
            CHECK(memory.size() == 0);
        }
    }
}
