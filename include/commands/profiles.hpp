#pragma once

int cmd_profiles(int argc, char** argv);
