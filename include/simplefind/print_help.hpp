#pragma once

void print_help();
