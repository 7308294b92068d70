/**
 * @file MultiProcessPolicyManager.cpp
 * @brief Policy manager dispatching learning to forked trainer processes
 * @author moinshaikh
 * @date 3/8/26
 */

#include<atomic>
#include<cerrno>
#include<chrono>
#include<csignal>
#include<cstdio>
#include<cstdlib>
#include<cstring>

#include<sys/wait.h>
#include<unistd.h>

#include<fmt/format.h>
#include<fmt/ranges.h>

#include"../../include/Manager/MultiProcessPolicyManager.hpp"
#include"../../include/Trainer/Trainer.hpp"

namespace PolicyHub
{
    MultiProcessPolicyManager::MultiProcessPolicyManager(const std::map<std::string, std::shared_ptr<Policy>> &policies,
                                                         int numTrainers,
                                                         const std::map<std::string, PolicyFactory> &factories,
                                                         PolicyManagerOptions options,
                                                         ProcessOptions processOptions) :
        PolicyManager(policies, options),
        processOptions(std::move(processOptions)),
        faulted(false)
    {
        if (numTrainers < 1)
        {
            throw ConfigurationError(fmt::format("A multi-process policy manager needs at least one trainer, got {}", numTrainers));
        }
        for (const auto &name : get_policy_names())
        {
            auto factory = factories.find(name);
            if (factory == factories.end() || !factory->second)
            {
                throw ConfigurationError(fmt::format("No factory given for policy '{}'", name));
            }
        }

        std::vector<std::string> pool;
        for (int i = 0; i < numTrainers; ++i)
        {
            pool.push_back(trainerName(i));
        }
        assignment = assignRoundRobin(get_policy_names(), pool);

        spawnTrainers(factories, options.logDir);
        try
        {
            context = std::make_unique<zmq::context_t>(1);
            for (const auto &trainer : assignment.trainers)
            {
                channels[trainer] = std::make_unique<Channel>(*context,
                                                              "ipc://" + socketPaths.at(trainer).string(),
                                                              Channel::Mode::Bind,
                                                              this->processOptions.receiveTimeoutMs);
            }
            initializeTrainers();
        }
        catch (const std::exception &e)
        {
            logger->error("Shutting down trainer processes: {}", e.what());
            reapTrainers(true);
            releaseTransport();
            throw;
        }
    }

    MultiProcessPolicyManager::~MultiProcessPolicyManager()
    {
        if (!is_closed())
        {
            try
            {
                exit();
            }
            catch (const std::exception &e)
            {
                logger->error("Failed to shut down trainer processes: {}", e.what());
            }
        }
    }

    void MultiProcessPolicyManager::spawnTrainers(const std::map<std::string, PolicyFactory> &factories,
                                                  const std::filesystem::path &logDir)
    {
        static std::atomic<int> instances(0);
        int instance = instances++;
        std::filesystem::create_directories(processOptions.runtimeDir);

        for (const auto &trainer : assignment.trainers)
        {
            std::map<std::string, PolicyFactory> owned;
            for (const auto &name : assignment.trainerToPolicies.at(trainer))
            {
                owned[name] = factories.at(name);
            }
            auto socketPath = processOptions.runtimeDir / fmt::format("policyhub-{}-{}-{}", ::getpid(), instance, trainer);
            auto url = "ipc://" + socketPath.string();

            logger->flush();
            std::fflush(nullptr);
            pid_t pid = ::fork();
            if (pid < 0)
            {
                int error = errno;
                reapTrainers(true);
                throw TrainerError(fmt::format("Cannot fork {}: {}", trainer, std::strerror(error)));
            }
            if (pid == 0)
            {
                int status = EXIT_SUCCESS;
                try
                {
                    runTrainerProcess(trainer, url, std::move(owned), logDir);
                }
                catch (const std::exception &e)
                {
                    spdlog::error("{} terminated: {}", trainer, e.what());
                    status = EXIT_FAILURE;
                }
                ::_exit(status);
            }

            processes[trainer] = pid;
            socketPaths[trainer] = socketPath;
            logger->info("Forked {} as process {} owning [{}]", trainer, pid,
                         fmt::join(assignment.trainerToPolicies.at(trainer), ", "));
        }
    }

    void MultiProcessPolicyManager::initializeTrainers()
    {
        for (const auto &trainer : assignment.trainers)
        {
            Message request;
            request.type = MessageTag::InitPolicyState;
            request.policyState = cachedStates(assignment.trainerToPolicies.at(trainer));
            channels.at(trainer)->send(request);
        }

        RoundReplies replies;
        for (const auto &trainer : assignment.trainers)
        {
            absorbReply(trainer, channels.at(trainer)->receive(), MessageTag::InitDone, replies);
        }
        if (!replies.failures.empty())
        {
            throw TrainerError(fmt::format("Trainer initialization failed: {}", fmt::join(replies.failures, "; ")));
        }
        for (const auto &trainer : assignment.trainers)
        {
            logger->info("{} initialized policies [{}]", trainer, fmt::join(assignment.trainerToPolicies.at(trainer), ", "));
        }
    }

    void MultiProcessPolicyManager::checkTrainersAlive()
    {
        std::vector<std::string> dead;
        for (auto entry = processes.begin(); entry != processes.end();)
        {
            int status = 0;
            pid_t reaped = ::waitpid(entry->second, &status, WNOHANG);
            if (reaped == entry->second)
            {
                if (WIFSIGNALED(status))
                {
                    dead.push_back(fmt::format("{} (killed by signal {})", entry->first, WTERMSIG(status)));
                }
                else
                {
                    dead.push_back(fmt::format("{} (exit status {})", entry->first, WEXITSTATUS(status)));
                }
                entry = processes.erase(entry);
            }
            else
            {
                ++entry;
            }
        }
        if (!dead.empty())
        {
            throw TrainerError(fmt::format("Trainer processes terminated: {}", fmt::join(dead, ", ")));
        }
    }

    template<class Operation>
    auto MultiProcessPolicyManager::guardTransport(Operation &&operation) -> decltype(operation())
    {
        try
        {
            return operation();
        }
        catch (const TrainerError &)
        {
            faulted = true;
            throw;
        }
        catch (const ProtocolError &)
        {
            faulted = true;
            throw;
        }
    }

    void MultiProcessPolicyManager::checkOpen() const
    {
        PolicyManager::checkOpen();
        if (faulted)
        {
            throw ManagerClosedError("update() called after a trainer transport failure; the policy manager must be exited");
        }
    }

    void MultiProcessPolicyManager::update(std::map<std::string, ExperienceSet> experienceByPolicy)
    {
        checkOpen();
        checkPolicyNames(experienceByPolicy);
        auto start = std::chrono::steady_clock::now();

        std::set<std::string> updated;
        auto due = stageExperiences(std::move(experienceByPolicy), updated);

        RoundReplies replies;
        guardTransport([&]()
        {
            checkTrainersAlive();
            for (const auto &trainer : assignment.trainers)
            {
                Message request;
                request.type = MessageTag::Learn;
                for (const auto &name : assignment.trainerToPolicies.at(trainer))
                {
                    auto batch = due.find(name);
                    if (batch != due.end())
                    {
                        request.experiences[name] = std::move(batch->second);
                    }
                }
                channels.at(trainer)->send(request);
            }
            for (const auto &trainer : assignment.trainers)
            {
                absorbReply(trainer, channels.at(trainer)->receive(), MessageTag::LearnDone, replies);
            }
        });

        if (!replies.failures.empty())
        {
            throw TrainerError(fmt::format("Update round failed: {}", fmt::join(replies.failures, "; ")));
        }
        commitRound(updated, std::move(replies.states), replies.trackers);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        logger->debug("policy update time: {} ms", elapsed.count());
    }

    void MultiProcessPolicyManager::exit()
    {
        PolicyManager::exit();

        bool kill = faulted;
        if (!faulted)
        {
            Message quit;
            quit.type = MessageTag::Exit;
            for (const auto &trainer : assignment.trainers)
            {
                try
                {
                    if (!channels.at(trainer)->trySend(quit))
                    {
                        logger->error("{} cannot be reached to exit", trainer);
                        kill = true;
                    }
                }
                catch (const TrainerError &e)
                {
                    logger->error("Cannot tell {} to exit: {}", trainer, e.what());
                    kill = true;
                }
            }
        }
        reapTrainers(kill);
        releaseTransport();
        logger->info("Exiting...");
    }

    void MultiProcessPolicyManager::reapTrainers(bool kill)
    {
        for (const auto &entry : processes)
        {
            if (kill)
            {
                ::kill(entry.second, SIGKILL);
            }
            int status = 0;
            if (::waitpid(entry.second, &status, 0) < 0)
            {
                logger->error("Cannot wait for {} (process {}): {}", entry.first, entry.second, std::strerror(errno));
                continue;
            }
            if (WIFEXITED(status) && WEXITSTATUS(status) != EXIT_SUCCESS)
            {
                logger->warn("{} exited with status {}", entry.first, WEXITSTATUS(status));
            }
            else if (WIFSIGNALED(status) && !kill)
            {
                logger->warn("{} was terminated by signal {}", entry.first, WTERMSIG(status));
            }
        }
        processes.clear();
    }

    void MultiProcessPolicyManager::releaseTransport()
    {
        channels.clear();
        context.reset();
        for (const auto &entry : socketPaths)
        {
            std::error_code error;
            std::filesystem::remove(entry.second, error);
        }
        socketPaths.clear();
    }
}
