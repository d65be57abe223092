//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WorkspaceResourceStrategy.h
// Purpose: workspace:// strategy listing and reading files through the PathSandbox
//==========================================================================================================

#pragma once

#include <memory>
#include "toolhost/PathSandbox.h"
#include "toolhost/resources/ResourceStrategy.h"
#include "toolhost/validation/SizeValidator.h"

namespace toolhost {
namespace resources {

//==========================================================================================================
// WorkspaceResourceStrategy
// Purpose: URIs are "workspace://" followed by a root-relative path.
// Notes:
//   List walks the directory recursively without following symlinks, keeps regular files the
//   sandbox allows reading, sorts by uri and paginates.
//   Read returns a byte window of the file. The window is checked against the SizeValidator, when
//   one is attached, before anything is loaded. Bytes that are not valid UTF-8 come back as U+FFFD;
//   length and total always count file bytes.
// Throws:
//   errors::OutOfSandboxError when the path leaves the root or is not readable under the rules.
//   errors::ResourceNotFoundError when the target does not exist.
//   errors::SizeLimitExceededError when the requested window exceeds the resource limit.
//   std::logic_error when no sandbox is attached.
//==========================================================================================================
class WorkspaceResourceStrategy : public ResourceStrategy {
public:
    static constexpr const char* kPrefix = "workspace://";

    WorkspaceResourceStrategy() = default;
    explicit WorkspaceResourceStrategy(std::shared_ptr<PathSandbox> sandbox,
                                       std::shared_ptr<validation::SizeValidator> sizeValidator = nullptr);

    void SetPathSandbox(std::shared_ptr<PathSandbox> sandbox);
    void SetSizeValidator(std::shared_ptr<validation::SizeValidator> sizeValidator);

    std::string UriPrefix() const override { return kPrefix; }
    std::string Description() const override { return "Workspace files and directories"; }

    ResourceListResult List(const ResourceListParams& params) const override;
    ResourceReadResult Read(const ResourceReadParams& params) const override;

private:
    const PathSandbox& sandboxOrThrow() const;

    std::shared_ptr<PathSandbox> sandbox;
    std::shared_ptr<validation::SizeValidator> sizeValidator;
};

} // namespace resources
} // namespace toolhost
