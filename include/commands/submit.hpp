#pragma once

int cmd_submit(int argc, char** argv);
