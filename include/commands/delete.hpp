#pragma once

int cmd_delete(int argc, char** argv);
