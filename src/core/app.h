#pragma once

int run_app(int argc, char **argv);
