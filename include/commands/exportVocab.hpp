#pragma once

int cmd_export_vocab(int argc, char** argv);
