#pragma once

int cmd_schema(int argc, char** argv);
