#pragma once

int cmd_match(int argc, char** argv);
