#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef POLICYHUB_LOGGING_HPP
#define POLICYHUB_LOGGING_HPP

#include<filesystem>
#include<memory>
#include<string>

#include<spdlog/spdlog.h>

namespace PolicyHub
{
    /**
     * @brief Builds a named logger for one component
     *
     * The logger always writes to the console. When @p logDir is not empty the directory
     * is created if needed and a second sink appends to `<logDir>/<tag>.log`.
     * Loggers are not registered globally, so several managers may share a tag.
     *
     * @param tag Logger name printed in every line (e.g. "POLICY_MANAGER", "TRAINER.0")
     * @param logDir Directory for the log file, or empty for console only
     */
    std::shared_ptr<spdlog::logger> makeLogger(const std::string &tag,
                                               const std::filesystem::path &logDir = {});
}

#endif //POLICYHUB_LOGGING_HPP
