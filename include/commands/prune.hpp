#pragma once

// resumable pruning of the configured vault (semsearch prune)
int cmd_prune(int argc, char** argv);

// standalone tool subcommands (vocab-prune split / prune)
int cmd_tool_split(int argc, char** argv);
int cmd_tool_prune(int argc, char** argv);
