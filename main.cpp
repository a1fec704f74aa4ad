#include "app/EmbeddingManagerCli.hpp"

int main(int argc, char** argv) {
    wikiembed::app::EmbeddingManagerCli cli;
    return cli.Run(argc, argv);
}
