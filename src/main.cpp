// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "cyclespitter_workflow.h"

int main(int argc, char** argv) {
  cyclespitter::CycleSpitterWorkflow workflow;
  return workflow.Run(argc, argv);
}
