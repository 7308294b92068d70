//
// Created by moinshaikh on 3/10/26.
//

#pragma once
#include"Errors.hpp"
#include"Logging.hpp"

#include"Experience/ExperienceMemory.hpp"
#include"Experience/ExperienceSet.hpp"

#include"Policy/MultiAgentPolicy.hpp"
#include"Policy/Policy.hpp"
#include"Policy/TorchPolicy.hpp"

#include"Communication/Channel.hpp"
#include"Communication/Endpoint.hpp"
#include"Communication/Message.hpp"

#include"Trainer/Trainer.hpp"

#include"Manager/DistributedPolicyManager.hpp"
#include"Manager/LocalPolicyManager.hpp"
#include"Manager/ManagerFactory.hpp"
#include"Manager/MultiProcessPolicyManager.hpp"
#include"Manager/PolicyManager.hpp"
