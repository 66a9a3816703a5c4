#include <iostream>
#include <string>
#include <optional>
#include "core/batch_game.h"
#include "core/scoring.h"
#include "engine/cascade.h"
#include "utils/globals.h"

using namespace std;

// Usage: board_dump [rows] [cols] [hazards] [n] [seed] [open_zero 0/1]
int main(int argc, char* argv[]) {
    try {
        int rows = argc > 1 ? stoi(argv[1]) : 9;
        int cols = argc > 2 ? stoi(argv[2]) : 9;
        int hazards = argc > 3 ? stoi(argv[3]) : 10;
        int n = argc > 4 ? stoi(argv[4]) : 2;
        optional<uint64_t> seed;
        if (argc > 5) seed = stoull(argv[5]);
        bool open = argc > 6 ? string(argv[6]) != "0" : true;

        BatchGame game(rows, cols, hazards, n, seed);
        cout << "Full boards:" << endl;
        for (int s = 0; s < game.n(); ++s) print_slot(game.numbers(), s);

        if (open) {
            ZeroCascade cascade(game);
            CascadeReport rep = cascade.open_zero();
            cout << "Cascade layers: " << rep.layers << " | starts: " << rep.starts.size() << endl;
        }

        cout << "Player view:" << endl;
        CountGrid state = game_state(game);
        vector<double> progress = scores(game);
        for (int s = 0; s < game.n(); ++s) {
            print_slot(state, s);
            cout << "progress " << progress[s] << " | active " << int(game.active()[s])
                 << " | won " << int(game.won()[s]) << endl;
        }
        return 0;
    } catch (const exception& e) {
        cerr << "[MAIN CRASH] " << e.what() << endl;
        return 1;
    }
}
