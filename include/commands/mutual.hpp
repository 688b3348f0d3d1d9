#pragma once

int cmd_mutual(int argc, char** argv);
